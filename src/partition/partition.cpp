#include "katsu/partition.hpp"
#include "katsu/loop_device.hpp"
#include "katsu/platform.hpp"

#include <algorithm>
#include <cctype>
#include <set>

#include <spdlog/spdlog.h>

namespace katsu {

namespace {

constexpr uint64_t MiB = 1024ull * 1024ull;

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool is_guid(const std::string& s) {
    if (s.size() != 36) return false;
    for (size_t i = 0; i < s.size(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (s[i] != '-') return false;
        } else if (!std::isxdigit(static_cast<unsigned char>(s[i]))) {
            return false;
        }
    }
    return true;
}

std::string trim_trailing_slashes(const std::string& mountpoint) {
    std::string out = mountpoint;
    while (!out.empty() && out.back() == '/') out.pop_back();
    return out;
}

size_t slash_count(const std::string& mountpoint) {
    std::string trimmed = trim_trailing_slashes(mountpoint);
    return static_cast<size_t>(std::count(trimmed.begin(), trimmed.end(), '/'));
}

bool is_root_mount(const std::string& mountpoint) {
    return !mountpoint.empty() && trim_trailing_slashes(mountpoint).empty();
}

// findmnt reports btrfs subvolume sources as "/dev/loop0p3[/home]"
std::string strip_subvolume_suffix(const std::string& source) {
    size_t bracket = source.find('[');
    return bracket == std::string::npos ? source : source.substr(0, bracket);
}

const char* FSTAB_HEADER =
    "# /etc/fstab: static file system information.\n"
    "#\n"
    "# Generated by katsu from the disk layout of the image manifest.\n"
    "# Rebuilding the image regenerates this file.\n"
    "#\n"
    "# <file system>\t<mount point>\t<type>\t<options>\t<dump>\t<pass>\n";

} // namespace

// ============================================================================
// Types and Flags
// ============================================================================

std::optional<PartitionType> parse_partition_type(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "root") return PartitionType::Root;
    if (lower == "root-arm64" || lower == "root-aarch64") return PartitionType::RootArm64;
    if (lower == "root-x86_64" || lower == "root-x86-64") return PartitionType::RootX86_64;
    if (lower == "esp" || lower == "efi") return PartitionType::Esp;
    if (lower == "xbootldr") return PartitionType::Xbootldr;
    if (lower == "swap") return PartitionType::Swap;
    if (lower == "linux-generic" || lower == "linux") return PartitionType::LinuxGeneric;
    if (is_guid(lower)) return PartitionType::Guid;
    return std::nullopt;
}

Result<std::string> resolve_type_guid(PartitionType type, const std::string& raw_guid,
                                      const std::string& arch) {
    switch (type) {
        case PartitionType::Root:
            if (arch == "x86_64") return success<std::string>("4f68bce3-e8cd-4db1-96e7-fbcaf984b709");
            if (arch == "aarch64") return success<std::string>("b921b045-1df0-41c3-af44-4c6f280d3fae");
            return failure<std::string>(ErrorKind::UnsupportedArch,
                                        "no root partition type for architecture '" + arch + "'");
        case PartitionType::RootArm64: return success<std::string>("b921b045-1df0-41c3-af44-4c6f280d3fae");
        case PartitionType::RootX86_64: return success<std::string>("4f68bce3-e8cd-4db1-96e7-fbcaf984b709");
        case PartitionType::Esp: return success<std::string>("c12a7328-f81f-11d2-ba4b-00a0c93ec93b");
        case PartitionType::Xbootldr: return success<std::string>("bc13c2ff-59e6-4262-a352-b275fd6f7172");
        case PartitionType::Swap: return success<std::string>("0657fd6d-a4ab-43c4-84e5-0933c84b4f4f");
        case PartitionType::LinuxGeneric: return success<std::string>("0fc63daf-8483-4772-8e79-3d69d8477de4");
        case PartitionType::Guid:
            if (!is_guid(raw_guid)) {
                return failure<std::string>(ErrorKind::ConfigInvalid, "invalid partition type GUID '" + raw_guid + "'");
            }
            return success(to_lower(raw_guid));
    }
    return failure<std::string>(ErrorKind::ConfigInvalid, "unknown partition type");
}

uint32_t PartitionFlag::bit() const {
    switch (kind) {
        case PartitionFlagKind::NoAuto: return 63;
        case PartitionFlagKind::ReadOnly: return 60;
        case PartitionFlagKind::GrowFs: return 59;
        case PartitionFlagKind::Position: return position;
    }
    return position;
}

std::optional<PartitionFlag> parse_partition_flag(const std::string& s) {
    std::string lower = to_lower(trim(s));
    PartitionFlag flag;
    if (lower == "no-auto" || lower == "noauto") {
        flag.kind = PartitionFlagKind::NoAuto;
    } else if (lower == "read-only" || lower == "readonly") {
        flag.kind = PartitionFlagKind::ReadOnly;
    } else if (lower == "grow-fs" || lower == "growfs") {
        flag.kind = PartitionFlagKind::GrowFs;
    } else if (!lower.empty() && lower.size() <= 3 &&
               std::all_of(lower.begin(), lower.end(), [](unsigned char c) { return std::isdigit(c); })) {
        flag.kind = PartitionFlagKind::Position;
        flag.position = static_cast<uint32_t>(std::stoul(lower));
    } else {
        return std::nullopt;
    }
    return flag;
}

// ============================================================================
// Validation
// ============================================================================

Status validate_layout(const PartitionLayout& layout, const std::string& arch) {
    if (layout.partitions.empty()) {
        return make_error(ErrorKind::ConfigInvalid, "partition layout is empty");
    }

    std::set<std::string> mountpoints;
    auto claim = [&mountpoints](const std::string& mp) -> bool {
        if (mp.empty()) return true;
        std::string key = trim_trailing_slashes(mp);
        return mountpoints.insert(key.empty() ? "/" : key).second;
    };

    for (size_t i = 0; i < layout.partitions.size(); ++i) {
        const auto& p = layout.partitions[i];
        std::string where = "partition " + std::to_string(i + 1);

        if (!p.size && i + 1 != layout.partitions.size()) {
            return make_error(ErrorKind::ConfigInvalid,
                              where + " has no size; only the last partition may extend to the end of the disk");
        }
        if (p.size && *p.size == 0) {
            return make_error(ErrorKind::ConfigInvalid, where + " has zero size");
        }
        if (p.filesystem.empty()) {
            return make_error(ErrorKind::ConfigInvalid, where + " has no filesystem");
        }
        if (!p.mountpoint.empty() && p.mountpoint.front() != '/') {
            return make_error(ErrorKind::ConfigInvalid, where + " mountpoint must be absolute: " + p.mountpoint);
        }
        if (!claim(p.mountpoint)) {
            return make_error(ErrorKind::ConfigInvalid, "duplicate mountpoint " + p.mountpoint);
        }
        for (const auto& sv : p.subvolumes) {
            if (sv.name.empty() || sv.mountpoint.empty() || sv.mountpoint.front() != '/') {
                return make_error(ErrorKind::ConfigInvalid, where + " has an invalid subvolume entry");
            }
            if (!claim(sv.mountpoint)) {
                return make_error(ErrorKind::ConfigInvalid, "duplicate mountpoint " + sv.mountpoint);
            }
        }
        if (!p.subvolumes.empty() && p.filesystem != "btrfs") {
            return make_error(ErrorKind::ConfigInvalid, where + " declares subvolumes but is not btrfs");
        }
        for (const auto& flag : p.flags) {
            if (flag.bit() > 63) {
                return make_error(ErrorKind::ConfigInvalid,
                                  where + " flag bit " + std::to_string(flag.bit()) + " is out of range");
            }
        }

        auto guid = resolve_type_guid(p.type, p.type_guid, arch);
        if (!guid.ok) return guid.status;
    }

    return ok_status();
}

// ============================================================================
// Mount Order
// ============================================================================

std::vector<MountEntry> mount_order(const PartitionLayout& layout) {
    std::vector<MountEntry> entries;
    for (size_t i = 0; i < layout.partitions.size(); ++i) {
        const auto& p = layout.partitions[i];
        if (!p.mountpoint.empty()) {
            entries.push_back({i + 1, p.mountpoint, p.filesystem, ""});
        }
        for (const auto& sv : p.subvolumes) {
            entries.push_back({i + 1, sv.mountpoint, p.filesystem, sv.name});
        }
    }

    std::stable_sort(entries.begin(), entries.end(), [](const MountEntry& a, const MountEntry& b) {
        bool a_root = is_root_mount(a.mountpoint);
        bool b_root = is_root_mount(b.mountpoint);
        if (a_root != b_root) return a_root;

        size_t a_depth = slash_count(a.mountpoint);
        size_t b_depth = slash_count(b.mountpoint);
        if (a_depth != b_depth) return a_depth < b_depth;

        return a.mountpoint < b.mountpoint;
    });

    return entries;
}

std::string partition_name(const std::string& base, size_t index) {
    bool needs_p = base.rfind("/dev/mmcblk", 0) == 0 ||
                   base.rfind("/dev/nvme", 0) == 0 ||
                   base.rfind("/dev/loop", 0) == 0;
    return base + (needs_p ? "p" : "") + std::to_string(index);
}

// ============================================================================
// Command Helpers
// ============================================================================

std::string parted_fs_name(const std::string& filesystem) {
    return filesystem == "efi" ? "fat32" : "ext4";
}

Command mkfs_command(const std::string& filesystem, const std::string& device) {
    if (filesystem == "efi") {
        return Command{"mkfs.fat", {"-F32", device}};
    }
    return Command{"mkfs." + filesystem, {device}};
}

std::string parted_offset(uint64_t bytes) {
    if (bytes % MiB == 0) return std::to_string(bytes / MiB) + "MiB";
    return std::to_string(bytes) + "B";
}

std::string fstab_type(const std::string& filesystem) {
    return filesystem == "efi" ? "vfat" : filesystem;
}

int fstab_pass(const std::string& filesystem) {
    return filesystem == "efi" ? 0 : 2;
}

std::string render_fstab(const std::vector<FstabLine>& lines) {
    std::string out = FSTAB_HEADER;
    for (const auto& line : lines) {
        out += "UUID=" + line.uuid + "\t" + line.mountpoint + "\t" + fstab_type(line.filesystem) + "\t" +
               line.options + "\t0\t" + std::to_string(fstab_pass(line.filesystem)) + "\n";
    }
    return out;
}

// ============================================================================
// Partition Engine
// ============================================================================

PartitionEngine::PartitionEngine(BuildContext& ctx, PartitionLayout layout, std::string arch)
    : ctx_(ctx), layout_(std::move(layout)), arch_(std::move(arch)) {}

Status PartitionEngine::apply(const std::string& device) {
    Status valid = validate_layout(layout_, arch_);
    if (!valid.ok) return valid;

    spdlog::info("Partitioning {}", device);

    Status label = ctx_.runner.run(Command{"parted", {"-s", device, "mklabel", "gpt"}, {}, true});
    if (!label.ok) return label;

    uint64_t offset = MiB;
    for (size_t i = 0; i < layout_.partitions.size(); ++i) {
        const auto& p = layout_.partitions[i];
        std::string index = std::to_string(i + 1);

        std::string start = parted_offset(offset);
        std::string end = p.size ? parted_offset(offset + *p.size) : "100%";
        spdlog::debug("Partition {}: {} {} -> {}", index, p.filesystem, start, end);

        Status created = ctx_.runner.run(Command{
            "parted", {"-s", device, "mkpart", "primary", parted_fs_name(p.filesystem), start, end}, {}, true});
        if (!created.ok) return created;

        auto guid = resolve_type_guid(p.type, p.type_guid, arch_);
        if (!guid.ok) return guid.status;

        Status typed = ctx_.runner.run(Command{"sgdisk", {"-t", index + ":" + guid.value, device}, {}, true});
        if (!typed.ok) return typed;

        for (const auto& flag : p.flags) {
            Status flagged = ctx_.runner.run(Command{
                "sgdisk", {"-A", index + ":set:" + std::to_string(flag.bit()), device}, {}, true});
            if (!flagged.ok) return flagged;
        }

        if (p.filesystem == "efi") {
            Status esp = ctx_.runner.run(Command{"parted", {"-s", device, "set", index, "esp", "on"}, {}, true});
            if (!esp.ok) return esp;
        }

        if (p.label) {
            Status named = ctx_.runner.run(Command{"parted", {"-s", device, "name", index, *p.label}, {}, true});
            if (!named.ok) return named;
        }

        if (p.size) offset += *p.size;
    }

    Status probed = ctx_.runner.run(Command{"partprobe", {device}, {}, true});
    if (!probed.ok) {
        spdlog::debug("partprobe {} failed, continuing: {}", device, probed.error);
    }

    for (size_t i = 0; i < layout_.partitions.size(); ++i) {
        const auto& p = layout_.partitions[i];
        std::string node = partition_name(device, i + 1);

        spdlog::info("Formatting {} as {}", node, p.filesystem);
        Command mkfs = mkfs_command(p.filesystem, node);
        mkfs.capture = true;
        Status formatted = ctx_.runner.run(mkfs);
        if (!formatted.ok) return formatted;

        if (!p.subvolumes.empty()) {
            Status subvols = create_subvolumes(p, node);
            if (!subvols.ok) return subvols;
        }
    }

    return ok_status();
}

Status PartitionEngine::create_subvolumes(const Partition& partition, const std::string& node) {
    ScopedMount top(ctx_.runner);
    Status mounted = top.mount(node, join_path(ctx_.workspace.root, "btrfs-top"));
    if (!mounted.ok) return mounted;

    for (const auto& sv : partition.subvolumes) {
        Status created = ctx_.runner.run(Command{
            "btrfs", {"subvolume", "create", join_path(top.target(), sv.name)}, {}, true});
        if (!created.ok) return created;
    }

    return top.unmount();
}

Status PartitionEngine::mount_to(const std::string& device, const std::string& chroot) {
    std::vector<std::string> done;

    auto rollback = [this, &done]() {
        for (auto it = done.rbegin(); it != done.rend(); ++it) {
            Status status = ctx_.runner.run(Command{"umount", {*it}, {}, true});
            if (!status.ok) spdlog::warn("Failed to unmount {}: {}", *it, status.error);
        }
    };

    for (const auto& entry : mount_order(layout_)) {
        std::string node = partition_name(device, entry.index);
        std::string target = path_under_root(chroot, entry.mountpoint);

        Status dir = ensure_directory(target);
        if (!dir.ok) {
            rollback();
            return dir;
        }

        Command cmd{"mount", {}, {}, true};
        if (!entry.subvolume.empty()) {
            cmd.args = {"-o", "subvol=" + entry.subvolume};
        }
        cmd.args.push_back(node);
        cmd.args.push_back(target);

        spdlog::debug("Mounting {} at {}", node, target);
        Status status = ctx_.runner.run(cmd);
        if (!status.ok) {
            rollback();
            return with_kind(std::move(status), ErrorKind::IoFailure);
        }
        done.push_back(target);
    }

    return ok_status();
}

Status PartitionEngine::unmount_from(const std::string& device, const std::string& chroot) {
    Status first_failure;

    auto order = mount_order(layout_);
    for (auto it = order.rbegin(); it != order.rend(); ++it) {
        // Subvolumes share a device node, so they are unmounted by path
        std::string what = it->subvolume.empty() ? partition_name(device, it->index)
                                                 : path_under_root(chroot, it->mountpoint);

        Status status = ctx_.runner.run(Command{"umount", {what}, {}, true});
        if (!status.ok) {
            spdlog::warn("Failed to unmount {}: {}", what, status.error);
            if (first_failure.ok) first_failure = with_kind(std::move(status), ErrorKind::IoFailure);
        }
    }

    return first_failure;
}

Result<std::string> PartitionEngine::fstab(const std::string& chroot) {
    std::vector<FstabLine> lines;

    for (const auto& entry : mount_order(layout_)) {
        std::string target = path_under_root(chroot, entry.mountpoint);

        auto source = ctx_.runner.output(Command{"findmnt", {"-n", "-o", "SOURCE", target}});
        if (!source.ok) return failure<std::string>(with_kind(source.status, ErrorKind::IoFailure));

        std::string device = strip_subvolume_suffix(trim(source.value));
        auto uuid = ctx_.runner.output(Command{"blkid", {"-s", "UUID", "-o", "value", device}});
        if (!uuid.ok) return failure<std::string>(with_kind(uuid.status, ErrorKind::IoFailure));

        FstabLine line;
        line.uuid = trim(uuid.value);
        line.mountpoint = entry.mountpoint;
        line.filesystem = entry.filesystem;
        if (!entry.subvolume.empty()) line.options = "subvol=" + entry.subvolume;

        if (line.uuid.empty()) {
            return failure<std::string>(ErrorKind::IoFailure, "no filesystem UUID for " + device);
        }
        lines.push_back(std::move(line));
    }

    return success(render_fstab(lines));
}

// ============================================================================
// MountedLayout
// ============================================================================

MountedLayout::MountedLayout(PartitionEngine& engine, std::string device, std::string chroot)
    : engine_(engine), device_(std::move(device)), chroot_(std::move(chroot)) {}

MountedLayout::~MountedLayout() {
    if (mounted_) {
        Status status = unmount();
        if (!status.ok) spdlog::warn("Failed to unmount disk layout: {}", status.error);
    }
}

Status MountedLayout::mount() {
    Status status = engine_.mount_to(device_, chroot_);
    if (status.ok) mounted_ = true;
    return status;
}

Status MountedLayout::unmount() {
    if (!mounted_) return ok_status();
    mounted_ = false;
    return engine_.unmount_from(device_, chroot_);
}

} // namespace katsu
