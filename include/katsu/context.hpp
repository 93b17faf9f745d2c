#pragma once

#include "katsu/process.hpp"
#include "katsu/types.hpp"

#include <string>

namespace katsu {

// ============================================================================
// Workspace Layout
// ============================================================================

// Process-scoped layout rooted at ./katsu-work/. Never deleted automatically.
struct Workspace {
    std::string root = "katsu-work";

    std::string chroot() const { return root + "/chroot"; }
    std::string iso_tree() const { return root + "/iso-tree"; }
    std::string image_dir() const { return root + "/image"; }
    std::string boot_images() const { return root + "/boot-images"; }
    std::string disk_image() const { return image_dir() + "/katsu.img"; }

    // Make root absolute, then create root, chroot/, iso-tree/ and image/
    Status create();
};

// ============================================================================
// Host Paths
// ============================================================================

// Host locations the engine reads from or mounts onto
struct HostPaths {
    std::string resolv_conf = "/etc/resolv.conf";
    std::string limine_share = "/usr/share/limine";
    std::string refind_share = "/usr/share/rEFInd/refind";
    std::string efiboot_mount = "/tmp/katsu.efiboot";    // EFI image population
    std::string rescue_mount = "/tmp/katsu-efiboot";     // grub2-mkrescue image
};

// ============================================================================
// Build Context
// ============================================================================

struct BuildContext {
    CommandRunner& runner;
    Workspace workspace;
    HostPaths host;
};

} // namespace katsu
