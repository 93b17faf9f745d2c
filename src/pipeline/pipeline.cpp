#include "katsu/pipeline.hpp"
#include "katsu/bootloader.hpp"
#include "katsu/image_packer.hpp"
#include "katsu/loop_device.hpp"
#include "katsu/partition.hpp"
#include "katsu/platform.hpp"
#include "katsu/root_builder.hpp"

#include <filesystem>
#include <system_error>

#include <spdlog/spdlog.h>

namespace katsu {

namespace fs = std::filesystem;

namespace {

PipelineResult failed(const std::string& phase, Status status) {
    PipelineResult result;
    result.phase = phase;
    result.status = std::move(status);
    return result;
}

PipelineResult failed(Phase phase, Status status) {
    return failed(phase_to_string(phase), std::move(status));
}

PipelineResult finished(std::string artifact) {
    PipelineResult result;
    result.ok = true;
    result.artifact = std::move(artifact);
    return result;
}

} // namespace

// ============================================================================
// Phases / Flags
// ============================================================================

std::optional<Phase> parse_phase(const std::string& s) {
    if (s == "root") return Phase::Root;
    if (s == "dracut") return Phase::Dracut;
    if (s == "rootimg") return Phase::Rootimg;
    if (s == "copy-live") return Phase::CopyLive;
    if (s == "iso") return Phase::Iso;
    if (s == "bootloader") return Phase::Bootloader;
    return std::nullopt;
}

SkipPhases SkipPhases::parse(const std::string& csv) {
    SkipPhases skip;
    for (const auto& name : split_list(csv, ',')) {
        auto phase = parse_phase(name);
        if (!phase) {
            spdlog::warn("Unknown phase '{}' in skip list, ignoring", name);
            continue;
        }
        skip.phases.insert(*phase);
    }
    return skip;
}

FeatureFlags FeatureFlags::parse(const std::string& csv) {
    FeatureFlags flags;
    for (const auto& name : split_list(csv, ',')) {
        if (name == "erofs") {
            flags.erofs = true;
        } else if (name == "isomd5") {
            flags.isomd5 = true;
        } else {
            spdlog::warn("Unknown feature flag '{}', ignoring", name);
        }
    }
    return flags;
}

Result<OutputKind> select_output_kind(const std::string& requested, const Manifest& manifest) {
    if (!requested.empty()) {
        auto kind = parse_output_kind(requested);
        if (!kind) {
            return failure<OutputKind>(ErrorKind::ConfigInvalid,
                                       "unknown output kind '" + requested +
                                           "' (expected iso, disk-image, device, folder or fs)");
        }
        return success(*kind);
    }
    return success(manifest.output.value_or(OutputKind::Iso));
}

// ============================================================================
// Pipeline
// ============================================================================

Pipeline::Pipeline(BuildContext& ctx, const Manifest& manifest, PipelineOptions options)
    : ctx_(ctx), manifest_(manifest), options_(std::move(options)) {}

bool Pipeline::skipped(Phase phase) const {
    if (options_.skip.contains(phase)) {
        spdlog::info("Skipping phase '{}'", phase_to_string(phase));
        return true;
    }
    return false;
}

PipelineResult Pipeline::run() {
    switch (options_.output) {
        case OutputKind::Iso:
            return run_iso();
        case OutputKind::DiskImage:
            return run_disk();
        case OutputKind::Folder:
            return run_folder();
        case OutputKind::Device:
        default:
            return failed("output", make_error(ErrorKind::ConfigInvalid,
                                               "Output kind 'device' is not supported"));
    }
}

PipelineResult Pipeline::run_iso() {
    Status created = ctx_.workspace.create();
    if (!created.ok) return failed("workspace", created);

    const std::string chroot = ctx_.workspace.chroot();
    const std::string tree = ctx_.workspace.iso_tree();
    const std::string out_iso = manifest_.out_file.empty() ? "out.iso" : manifest_.out_file;

    ImagePacker packer(ctx_, manifest_);
    BootloaderStager stager(ctx_, manifest_);

    spdlog::info("Building ISO {} ({})", out_iso, bootloader_to_string(manifest_.bootloader));

    if (!skipped(Phase::Root)) {
        auto built = build_root(make_root_builder(manifest_), ctx_, chroot, manifest_);
        if (!built.ok) return failed(Phase::Root, built.status);
    }

    if (!skipped(Phase::Dracut)) {
        Status s = packer.dracut(chroot);
        if (!s.ok) return failed(Phase::Dracut, s);
    }

    if (!skipped(Phase::Rootimg)) {
        const std::string image = join_path(tree, "LiveOS/squashfs.img");
        bool erofs = options_.features.erofs || manifest_.iso.rootfs == RootfsFormat::Erofs;
        Status s = erofs ? packer.erofs(chroot, image) : packer.squashfs(chroot, image);
        if (!s.ok) return failed(Phase::Rootimg, s);
    }

    if (!skipped(Phase::CopyLive)) {
        Status s = stager.copy_liveos();
        if (!s.ok) return failed(Phase::CopyLive, s);
    }

    if (!skipped(Phase::Iso)) {
        Status s = packer.xorriso(tree, out_iso);
        if (!s.ok) return failed(Phase::Iso, s);

        if (options_.features.isomd5) {
            s = packer.implant_isomd5(out_iso);
            if (!s.ok) return failed(Phase::Iso, s);
        }
    }

    if (!skipped(Phase::Bootloader)) {
        Status s = stager.install(out_iso);
        if (!s.ok) return failed(Phase::Bootloader, s);
    }

    spdlog::info("ISO written to {}", out_iso);
    return finished(out_iso);
}

PipelineResult Pipeline::run_disk() {
    if (!manifest_.disk) {
        return failed("disk", make_error(ErrorKind::ConfigInvalid,
                                         "Disk output requires a 'disk' layout in the manifest"));
    }
    const PartitionLayout& layout = *manifest_.disk;
    if (!layout.size) {
        return failed("disk", make_error(ErrorKind::ConfigInvalid, "Disk layout has no total 'size'"));
    }

    const std::string arch = target_arch(manifest_);
    Status valid = validate_layout(layout, arch);
    if (!valid.ok) return failed("disk", valid);

    Status created = ctx_.workspace.create();
    if (!created.ok) return failed("workspace", created);

    const std::string image = ctx_.workspace.disk_image();
    const std::string chroot = ctx_.workspace.chroot();

    Status sparse = create_sparse_file(image, *layout.size);
    if (!sparse.ok) return failed("disk", sparse);

    {
        LoopDevice loop(ctx_.runner);
        Status attached = loop.attach(image);
        if (!attached.ok) return failed("disk", attached);

        PartitionEngine engine(ctx_, layout, arch);
        Status applied = engine.apply(loop.path());
        if (!applied.ok) return failed("disk", applied);

        if (!skipped(Phase::Root)) {
            MountedLayout mounted(engine, loop.path(), chroot);
            Status m = mounted.mount();
            if (!m.ok) return failed(Phase::Root, m);

            auto built = build_root(make_root_builder(manifest_), ctx_, chroot, manifest_);
            if (!built.ok) return failed(Phase::Root, built.status);

            Status u = mounted.unmount();
            if (!u.ok) return failed(Phase::Root, u);
        }

        Status detached = loop.detach();
        if (!detached.ok) return failed("disk", detached);
    }

    std::string artifact = image;
    if (!manifest_.out_file.empty() && manifest_.out_file != image) {
        std::error_code ec;
        fs::rename(image, manifest_.out_file, ec);
        if (ec) {
            ec.clear();
            fs::copy_file(image, manifest_.out_file, fs::copy_options::overwrite_existing, ec);
            if (ec) {
                return failed("disk", make_error(ErrorKind::IoFailure,
                                                 "Failed to move disk image to " + manifest_.out_file +
                                                 ": " + ec.message()));
            }
        }
        artifact = manifest_.out_file;
    }

    if (!skipped(Phase::Bootloader)) {
        BootloaderStager stager(ctx_, manifest_);
        Status s = stager.install(artifact);
        if (!s.ok) return failed(Phase::Bootloader, s);
    }

    spdlog::info("Disk image written to {}", artifact);
    return finished(artifact);
}

PipelineResult Pipeline::run_folder() {
    Status created = ctx_.workspace.create();
    if (!created.ok) return failed("workspace", created);

    std::string target = ctx_.workspace.chroot();
    if (!manifest_.out_file.empty()) {
        std::error_code ec;
        target = fs::absolute(manifest_.out_file, ec).lexically_normal().string();
        if (ec) {
            return failed("workspace", make_error(ErrorKind::IoFailure,
                                                  "Failed to resolve " + manifest_.out_file + ": " + ec.message()));
        }
    }

    if (!skipped(Phase::Root)) {
        Status dir = ensure_directory(target);
        if (!dir.ok) return failed(Phase::Root, dir);

        auto built = build_root(make_root_builder(manifest_), ctx_, target, manifest_);
        if (!built.ok) return failed(Phase::Root, built.status);
    }

    spdlog::info("Root tree written to {}", target);
    return finished(target);
}

} // namespace katsu
