#pragma once

#include "katsu/context.hpp"
#include "katsu/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace katsu {

// ============================================================================
// GPT Partition Types
// ============================================================================

enum class PartitionType {
    Root,          // resolved to RootX86_64 or RootArm64 at apply time
    RootArm64,
    RootX86_64,
    Esp,
    Xbootldr,
    Swap,
    LinuxGeneric,
    Guid,          // raw GUID carried in Partition::type_guid
};

std::optional<PartitionType> parse_partition_type(const std::string& s);

// GUID for a partition type on the given target architecture.
// Root on anything but x86_64/aarch64 is UnsupportedArch.
Result<std::string> resolve_type_guid(PartitionType type, const std::string& raw_guid,
                                      const std::string& arch);

// ============================================================================
// GPT Attribute Flags
// ============================================================================

enum class PartitionFlagKind {
    NoAuto,     // bit 63
    ReadOnly,   // bit 60
    GrowFs,     // bit 59
    Position,   // raw bit index 0-63
};

struct PartitionFlag {
    PartitionFlagKind kind = PartitionFlagKind::Position;
    uint32_t position = 0;

    uint32_t bit() const;
};

std::optional<PartitionFlag> parse_partition_flag(const std::string& s);

// ============================================================================
// Layout
// ============================================================================

struct Subvolume {
    std::string name;
    std::string mountpoint;
};

struct Partition {
    std::optional<std::string> label;
    std::optional<uint64_t> size;     // absent: extends to the end of the disk
    std::string filesystem;           // efi, ext4, btrfs, xfs, vfat, ...
    std::string mountpoint;
    PartitionType type = PartitionType::LinuxGeneric;
    std::string type_guid;            // only for PartitionType::Guid
    std::vector<PartitionFlag> flags;
    std::vector<Subvolume> subvolumes;
};

struct PartitionLayout {
    std::optional<uint64_t> size;     // total disk image size
    std::vector<Partition> partitions;
};

// Rejects empty layouts, an unsized partition that is not last, duplicate
// mountpoints, out-of-range flag bits and Root on unsupported architectures
Status validate_layout(const PartitionLayout& layout, const std::string& arch);

// ============================================================================
// Mount Order
// ============================================================================

struct MountEntry {
    size_t index = 0;           // 1-based partition index (declaration order)
    std::string mountpoint;
    std::string filesystem;
    std::string subvolume;      // non-empty for btrfs subvolumes
};

// "/" first, then ascending slash count (trailing '/' ignored), then
// lexicographic. Subvolumes are ordered alongside partitions; partitions
// without a mountpoint are left out.
std::vector<MountEntry> mount_order(const PartitionLayout& layout);

// /dev/loop0 + 1 -> /dev/loop0p1, /dev/sda + 1 -> /dev/sda1
std::string partition_name(const std::string& base, size_t index);

// ============================================================================
// Command Helpers
// ============================================================================

// parted filesystem name: efi -> fat32, anything else -> ext4
std::string parted_fs_name(const std::string& filesystem);

// mkfs invocation for a partition device node
Command mkfs_command(const std::string& filesystem, const std::string& device);

// parted offset literal, "<n>MiB" when MiB-aligned and "<n>B" otherwise
std::string parted_offset(uint64_t bytes);

// fstab type column: efi -> vfat
std::string fstab_type(const std::string& filesystem);

// fstab pass column: 0 for efi, 2 otherwise
int fstab_pass(const std::string& filesystem);

struct FstabLine {
    std::string uuid;
    std::string mountpoint;
    std::string filesystem;
    std::string options = "defaults";
};

// Header comment, legend and one tab-separated line per entry
std::string render_fstab(const std::vector<FstabLine>& lines);

// ============================================================================
// Partition Engine
// ============================================================================

class PartitionEngine {
public:
    PartitionEngine(BuildContext& ctx, PartitionLayout layout, std::string arch);

    // Write a GPT, create, type, flag, name and format every partition
    Status apply(const std::string& device);

    // Mount every entry of the mount order below chroot
    Status mount_to(const std::string& device, const std::string& chroot);

    // Unmount in reverse mount order; continues past failures
    Status unmount_from(const std::string& device, const std::string& chroot);

    // fstab for the currently mounted layout (findmnt + blkid)
    Result<std::string> fstab(const std::string& chroot);

    const PartitionLayout& layout() const { return layout_; }

private:
    Status create_subvolumes(const Partition& partition, const std::string& node);

    BuildContext& ctx_;
    PartitionLayout layout_;
    std::string arch_;
};

// Keeps a layout mounted for the lifetime of the object
class MountedLayout {
public:
    MountedLayout(PartitionEngine& engine, std::string device, std::string chroot);
    ~MountedLayout();

    MountedLayout(const MountedLayout&) = delete;
    MountedLayout& operator=(const MountedLayout&) = delete;

    Status mount();
    Status unmount();

private:
    PartitionEngine& engine_;
    std::string device_;
    std::string chroot_;
    bool mounted_ = false;
};

} // namespace katsu
