#pragma once

#include "katsu/context.hpp"
#include "katsu/manifest.hpp"
#include "katsu/templates.hpp"
#include "katsu/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace katsu {

// ============================================================================
// Architecture Mapping
// ============================================================================

struct ArchInfo {
    std::string short_name;          // x64, aa64
    std::string short_upper;         // X64, AA64
    std::string legacy;              // IA32, ARM
    std::string grub_platform;       // directory under usr/lib/grub
    std::string grub_image_format;   // grub2-mkimage -O
    std::vector<std::string> extra_modules;
};

// x86_64 and aarch64; anything else is UnsupportedArch
Result<ArchInfo> arch_info(const std::string& arch);

// ============================================================================
// Kernel and Initramfs Discovery
// ============================================================================

struct KernelImage {
    std::string version;
    std::string path;    // <chroot>/usr/lib/modules/<version>/vmlinuz
};

// First entry (by name) of <chroot>/usr/lib/modules/
Result<KernelImage> find_vmlinuz(const std::string& chroot);

// initramfs.img or initramfs-* in <chroot>/boot/, never a -rescue- image
Result<std::string> find_initramfs(const std::string& chroot);

// Copy the kernel to <dest>/boot/vmlinuz and, when requested, the
// initramfs to <dest>/boot/initramfs.img
Status copy_kernel(const std::string& chroot, const std::string& dest, bool copy_initramfs);

// ============================================================================
// Boot Binaries
// ============================================================================

struct BootBinaries {
    std::string uefi;   // relative to the ISO tree
    std::string bios;   // empty when the variant has no BIOS image
};

// GrubBios and SystemdBoot have no ISO binaries and are ConfigInvalid
Result<BootBinaries> boot_binaries(Bootloader bootloader);

// ============================================================================
// EFI Boot Image
// ============================================================================

constexpr uint64_t GRUB_EFI_IMAGE_SIZE = 25ull * 1024 * 1024;
constexpr uint64_t REFIND_EFI_IMAGE_SIZE = 256ull * 1024 * 1024;

// Build <tree>/boot/efiboot.img: a FAT image labelled EFI holding
// <tree>/EFI/BOOT and, with include_kernel, boot/vmlinuz + boot/initramfs.img
Status build_efi_image(BuildContext& ctx, const std::string& tree, uint64_t size, bool include_kernel);

// ============================================================================
// Bootloader Stager
// ============================================================================

class BootloaderStager {
public:
    BootloaderStager(BuildContext& ctx, const Manifest& manifest);

    // Populate the ISO tree's boot/ and EFI/ directories for the variant
    Status copy_liveos();

    // Post-install against a finished image or ISO
    Status install(const std::string& image);

    Status stage_grub();
    Status stage_limine();
    Status stage_refind();

private:
    BootConfigFields config_fields() const;

    BuildContext& ctx_;
    const Manifest& manifest_;
    std::string arch_;
};

} // namespace katsu
