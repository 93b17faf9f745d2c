#include "katsu/platform.hpp"
#include "katsu/root_builder.hpp"

#include <filesystem>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace katsu {

namespace {

// Tag separator, ignoring a ':' that belongs to a registry port
size_t tag_separator(const std::string& image) {
    size_t colon = image.rfind(':');
    size_t slash = image.rfind('/');
    if (colon == std::string::npos) return std::string::npos;
    if (slash != std::string::npos && colon < slash) return std::string::npos;
    return colon;
}

Status push_into_chroot(BuildContext& ctx, const OciOptions& oci, const std::string& chroot,
                        const std::string& image) {
    spdlog::info("Embedding {} into the image container store", image);
    return ctx.runner.run(Command{
        oci.runtime,
        {"push", image, OciRootBuilder::storage_destination(chroot, image), "--remove-signatures"}});
}

Status write_image_metadata(BuildContext& ctx, const OciOptions& oci, const std::string& chroot) {
    auto digest = ctx.runner.output(Command{oci.runtime, {"inspect", "--format", "{{.Digest}}", oci.image}});
    if (!digest.ok) return digest.status;

    nlohmann::json meta;
    meta["image"] = oci.image;
    meta["digest"] = trim(digest.value);
    return atomic_write_file(join_path(chroot, ".bootc_meta.json"), meta.dump(2) + "\n");
}

} // namespace

std::string OciRootBuilder::derived_tag(const std::string& image) {
    size_t sep = tag_separator(image);
    std::string base = sep == std::string::npos ? image : image.substr(0, sep);
    return base + ":katsu_deriv";
}

std::string OciRootBuilder::storage_destination(const std::string& chroot, const std::string& image) {
    return "containers-storage:[overlay@" + chroot + "/var/lib/containers/storage]" + image;
}

Result<TreeOutput> OciRootBuilder::build(BuildContext& ctx, const std::string& chroot,
                                         const Manifest& manifest) const {
    const OciOptions& oci = manifest.oci;
    if (oci.image.empty()) {
        return failure<TreeOutput>(ErrorKind::ConfigInvalid, "no OCI image configured");
    }

    Status dir = ensure_directory(chroot);
    if (!dir.ok) return failure<TreeOutput>(dir);

    spdlog::info("Pulling {}", oci.image);
    Status pulled = ctx.runner.run(Command{oci.runtime, {"pull", oci.image}});
    if (!pulled.ok) return failure<TreeOutput>(pulled);

    std::string source_image = oci.image;
    if (!oci.derivation.empty()) {
        source_image = derived_tag(oci.image);
        spdlog::info("Building derived image {} from {}", source_image, oci.derivation);
        Status built = ctx.runner.run(Command{
            oci.runtime,
            {"build", "-t", source_image, "--network", "host", "--build-arg", "DERIVE_FROM=" + oci.image,
             "-f", oci.derivation, oci.context.empty() ? "." : oci.context}});
        if (!built.ok) return failure<TreeOutput>(built);
    }

    auto created = ctx.runner.output(Command{oci.runtime, {"create", "--rm", source_image, "/bin/bash"}});
    if (!created.ok) return failure<TreeOutput>(created.status);
    std::string container = trim(created.value);

    std::string tarball = join_path(ctx.workspace.root, "oci-export.tar");
    spdlog::info("Exporting container {} into {}", container, chroot);

    Status exported = ctx.runner.run(Command{oci.runtime, {"export", "-o", tarball, container}});
    Status extracted = exported.ok ? ctx.runner.run(Command{"tar", {"-xf", tarball, "-C", chroot}})
                                   : exported;

    std::error_code ec;
    std::filesystem::remove(tarball, ec);

    Status removed = ctx.runner.run(Command{oci.runtime, {"rm", container}, {}, true});
    if (!removed.ok) spdlog::debug("Could not remove container {}: {}", container, removed.error);

    if (!extracted.ok) return failure<TreeOutput>(extracted);

    if (oci.embed_image || !oci.embed_extra_images.empty()) {
        Status store = ensure_directory(join_path(chroot, "var/lib/containers/storage"));
        if (!store.ok) return failure<TreeOutput>(store);

        if (oci.embed_image) {
            Status pushed = push_into_chroot(ctx, oci, chroot, oci.image);
            if (!pushed.ok) return failure<TreeOutput>(pushed);
        }
        for (const auto& extra : oci.embed_extra_images) {
            Status pulled_extra = ctx.runner.run(Command{oci.runtime, {"pull", extra}});
            if (!pulled_extra.ok) return failure<TreeOutput>(pulled_extra);
            Status pushed = push_into_chroot(ctx, oci, chroot, extra);
            if (!pushed.ok) return failure<TreeOutput>(pushed);
        }

        // The push leaves the overlay store mounted; failure here is expected
        Status umounted = ctx.runner.run(
            Command{"umount", {join_path(chroot, "var/lib/containers/storage/overlay")}, {}, true});
        if (!umounted.ok) spdlog::debug("Overlay store was not mounted");
    }

    if (oci.embed_image_metadata) {
        Status meta = write_image_metadata(ctx, oci, chroot);
        if (!meta.ok) return failure<TreeOutput>(meta);
    }

    return success(TreeOutput{TreeOutputKind::Directory, chroot});
}

} // namespace katsu
