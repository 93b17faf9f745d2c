#include "katsu/root_builder.hpp"

#include <variant>

namespace katsu {

RootBuilder make_root_builder(const Manifest& manifest) {
    if (manifest.builder == RootBuilderKind::Oci) return OciRootBuilder{};
    return PackageRootBuilder{};
}

Result<TreeOutput> build_root(const RootBuilder& builder, BuildContext& ctx,
                              const std::string& chroot, const Manifest& manifest) {
    return std::visit([&](const auto& b) { return b.build(ctx, chroot, manifest); }, builder);
}

} // namespace katsu
