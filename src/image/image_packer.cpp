#include "katsu/image_packer.hpp"
#include "katsu/chroot.hpp"
#include "katsu/platform.hpp"

#include <cstdlib>
#include <filesystem>
#include <set>

#include <spdlog/spdlog.h>

namespace katsu {

namespace fs = std::filesystem;

// ============================================================================
// dracut
// ============================================================================

DracutOptions DracutOptions::from_environment() {
    DracutOptions options;
    if (const char* mods = std::getenv("KATSU_DRACUT_MODS")) {
        options.modules = mods;
    }
    if (const char* omit = std::getenv("KATSU_DRACUT_OMIT")) {
        options.omit = omit;
    }
    return options;
}

Result<std::string> find_initramfs_kver(const std::string& chroot) {
    const std::string prefix = "initramfs-";
    const std::string suffix = ".img";

    for (const auto& name : list_directory_names(join_path(chroot, "boot"))) {
        if (name.size() <= prefix.size() + suffix.size()) continue;
        if (name.rfind(prefix, 0) != 0) continue;
        if (name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) continue;

        std::string kver = name.substr(prefix.size(), name.size() - prefix.size() - suffix.size());
        if (kver.find("-rescue-") != std::string::npos) continue;
        return success(kver);
    }

    return failure<std::string>(ErrorKind::ResourceMissing, "Can't find initramfs in " + chroot + "/boot");
}

std::vector<std::string> dracut_args(const std::string& chroot, const std::string& kver,
                                     const DracutOptions& options) {
    return unshare_args(chroot, "dracut", {
        "--xz", "-vfNa", options.modules,
        "-o", options.omit,
        "--no-early-microcode",
        "/boot/initramfs-" + kver + ".img", kver,
    });
}

// ============================================================================
// Root Images
// ============================================================================

Result<std::vector<std::string>> squashfs_args(const std::string& chroot, const std::string& out,
                                               const std::string& compression) {
    std::vector<std::string> comp;
    if (compression == "gzip") comp = {"-comp", "gzip", "-Xcompression-level", "9"};
    else if (compression == "lzo") comp = {"-comp", "lzo"};
    else if (compression == "lz4") comp = {"-comp", "lz4", "-Xhc"};
    else if (compression == "xz") comp = {"-comp", "xz", "-Xbcj", "x86"};
    else if (compression == "zstd") comp = {"-comp", "zstd", "-Xcompression-level", "19"};
    else if (compression == "lzma") comp = {"-comp", "lzma"};
    else {
        return failure<std::vector<std::string>>(ErrorKind::ConfigInvalid,
                                                 "unknown squashfs compression '" + compression + "'");
    }

    std::vector<std::string> args = {chroot, out};
    args.insert(args.end(), comp.begin(), comp.end());
    args.insert(args.end(), {"-b", "1048576", "-noappend"});
    return success(std::move(args));
}

std::vector<std::string> erofs_args(const ErofsOptions& options, const std::string& source,
                                    const std::string& target) {
    std::vector<std::string> args;

    if (options.log_level) {
        if (*options.log_level == 0) {
            args.push_back("--quiet");
        } else {
            args.push_back("-d" + std::to_string(*options.log_level));
        }
    }

    args.push_back("-z" + options.compression);
    args.push_back("-x" + std::to_string(options.xattr_level));
    args.push_back("-C" + std::to_string(options.chunk_size));

    std::set<std::string> seen;
    for (const auto& path : options.exclude_paths) {
        if (seen.insert(path).second) {
            args.push_back("--exclude-path=" + path);
        }
    }

    if (!options.file_contexts.empty()) {
        args.push_back("--file-contexts=" + options.file_contexts);
    }

    if (!options.features.empty()) {
        std::string joined;
        for (const auto& f : options.features) {
            if (!joined.empty()) joined += ",";
            joined += f;
        }
        args.push_back("-E" + joined);
    }

    args.push_back(target);
    args.push_back(source);
    return args;
}

// ============================================================================
// ISO Mastering
// ============================================================================

Result<std::vector<std::string>> xorriso_args(const Manifest& manifest, const Workspace& workspace,
                                              const std::string& tree, const std::string& out_iso) {
    auto bins = boot_binaries(manifest.bootloader);
    if (!bins.ok) return failure<std::vector<std::string>>(bins.status);

    const std::string& volid = manifest.iso.volume_id;
    std::vector<std::string> args = {"-as", "mkisofs"};

    if (manifest.bootloader == Bootloader::Grub) {
        args.insert(args.end(), {"-R", "-V", volid});
        if (target_arch(manifest) == "x86_64") {
            args.insert(args.end(), {"--grub2-mbr", join_path(workspace.boot_images(), "boot_hybrid.img")});
        }
        args.insert(args.end(), {
            "-partition_offset", "16",
            "-appended_part_as_gpt",
            "-append_partition", "2", "C12A7328-F81F-11D2-BA4B-00A0C93EC93B", join_path(tree, bins.value.uefi),
            "-iso_mbr_part_type", "EBD0A0A2-B9E5-4433-87C0-68B6B72699C7",
            "-c", "boot.cat", "--boot-catalog-hide",
            "-b", bins.value.bios,
            "-no-emul-boot", "-boot-load-size", "4", "-boot-info-table", "--grub2-boot-info",
            "-eltorito-alt-boot",
            "-e", "--interval:appended_partition_2:all::",
            "-no-emul-boot",
            tree,
            "-o", out_iso,
        });
        return success(std::move(args));
    }

    args.push_back("-R");
    if (!bins.value.bios.empty()) {
        args.insert(args.end(), {"-b", bins.value.bios, "-no-emul-boot", "-boot-load-size", "4", "-boot-info-table"});
    }
    args.insert(args.end(), {
        "--efi-boot", bins.value.uefi,
        "-efi-boot-part", "--efi-boot-image",
        "--protective-msdos-label",
        tree,
        "-volid", volid,
        "-o", out_iso,
    });
    return success(std::move(args));
}

// ============================================================================
// Image Packer
// ============================================================================

ImagePacker::ImagePacker(BuildContext& ctx, const Manifest& manifest) : ctx_(ctx), manifest_(manifest) {}

Status ImagePacker::dracut(const std::string& chroot) {
    auto kver = find_initramfs_kver(chroot);
    if (!kver.ok) return kver.status;

    spdlog::info("Generating initramfs for kernel {}", kver.value);
    DracutOptions options = DracutOptions::from_environment();

    return with_chroot(ctx_, chroot, [&]() {
        return ctx_.runner.run(Command{"unshare", dracut_args(chroot, kver.value, options)});
    });
}

Status ImagePacker::squashfs(const std::string& chroot, const std::string& out) {
    auto args = squashfs_args(chroot, out, manifest_.iso.squashfs_compression);
    if (!args.ok) return args.status;

    Status dir = ensure_directory(fs::path(out).parent_path().string());
    if (!dir.ok) return dir;

    spdlog::info("Squashing root filesystem into {}", out);
    return ctx_.runner.run(Command{"mksquashfs", args.value});
}

Status ImagePacker::erofs(const std::string& chroot, const std::string& out) {
    Status dir = ensure_directory(fs::path(out).parent_path().string());
    if (!dir.ok) return dir;

    spdlog::info("Packing root filesystem into {} (erofs)", out);
    return ctx_.runner.run(Command{"mkfs.erofs", erofs_args(manifest_.iso.erofs, chroot, out)});
}

Status ImagePacker::xorriso(const std::string& tree, const std::string& out_iso) {
    auto args = xorriso_args(manifest_, ctx_.workspace, tree, out_iso);
    if (!args.ok) return args.status;

    spdlog::info("Mastering ISO {}", out_iso);
    return ctx_.runner.run(Command{"xorriso", args.value});
}

Status ImagePacker::implant_isomd5(const std::string& image) {
    spdlog::info("Implanting MD5 checksum into {}", image);
    return ctx_.runner.run(Command{"implantisomd5", {"--force", "--supported-iso", image}, {}, true});
}

} // namespace katsu
