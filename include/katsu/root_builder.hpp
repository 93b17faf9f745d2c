#pragma once

#include "katsu/context.hpp"
#include "katsu/manifest.hpp"
#include "katsu/types.hpp"

#include <string>
#include <variant>
#include <vector>

namespace katsu {

// ============================================================================
// Tree Output
// ============================================================================

enum class TreeOutputKind {
    Directory,
    Tarball,    // reserved
    Image,      // reserved
};

struct TreeOutput {
    TreeOutputKind kind = TreeOutputKind::Directory;
    std::string path;
};

// ============================================================================
// Package Root Builder (dnf)
// ============================================================================

class PackageRootBuilder {
public:
    Result<TreeOutput> build(BuildContext& ctx, const std::string& chroot, const Manifest& manifest) const;

    // Transaction arguments for the package manager (without the program)
    static std::vector<std::string> install_args(const DnfOptions& dnf, const std::string& chroot,
                                                 const std::string& arch);
};

// ============================================================================
// OCI Root Builder (podman)
// ============================================================================

class OciRootBuilder {
public:
    Result<TreeOutput> build(BuildContext& ctx, const std::string& chroot, const Manifest& manifest) const;

    // "registry/img:tag" -> "registry/img:katsu_deriv"
    static std::string derived_tag(const std::string& image);

    // containers-storage transport pointing into the chroot's store
    static std::string storage_destination(const std::string& chroot, const std::string& image);
};

// ============================================================================
// Dispatch
// ============================================================================

using RootBuilder = std::variant<PackageRootBuilder, OciRootBuilder>;

RootBuilder make_root_builder(const Manifest& manifest);

Result<TreeOutput> build_root(const RootBuilder& builder, BuildContext& ctx,
                              const std::string& chroot, const Manifest& manifest);

} // namespace katsu
