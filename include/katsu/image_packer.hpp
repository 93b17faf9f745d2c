#pragma once

#include "katsu/bootloader.hpp"
#include "katsu/context.hpp"
#include "katsu/manifest.hpp"
#include "katsu/types.hpp"

#include <string>
#include <vector>

namespace katsu {

// ============================================================================
// dracut
// ============================================================================

struct DracutOptions {
    std::string modules = "livenet dmsquash-live dmsquash-live-ntfs convertfs pollcdrom qemu qemu-net";
    std::string omit = "plymouth multipath";

    // Defaults overridden by KATSU_DRACUT_MODS / KATSU_DRACUT_OMIT
    static DracutOptions from_environment();
};

// Kernel version from <chroot>/boot/initramfs-<ver>.img, skipping rescue images
Result<std::string> find_initramfs_kver(const std::string& chroot);

// unshare arguments running dracut inside chroot
std::vector<std::string> dracut_args(const std::string& chroot, const std::string& kver,
                                     const DracutOptions& options);

// ============================================================================
// Root Images
// ============================================================================

// mksquashfs arguments; compression is gzip, lzo, lz4, xz, zstd or lzma
Result<std::vector<std::string>> squashfs_args(const std::string& chroot, const std::string& out,
                                               const std::string& compression);

// mkfs.erofs arguments; exclude paths are de-duplicated keeping declared order
std::vector<std::string> erofs_args(const ErofsOptions& options, const std::string& source,
                                    const std::string& target);

// ============================================================================
// ISO Mastering
// ============================================================================

// xorriso -as mkisofs arguments for the manifest's bootloader
Result<std::vector<std::string>> xorriso_args(const Manifest& manifest, const Workspace& workspace,
                                              const std::string& tree, const std::string& out_iso);

// ============================================================================
// Image Packer
// ============================================================================

class ImagePacker {
public:
    ImagePacker(BuildContext& ctx, const Manifest& manifest);

    Status dracut(const std::string& chroot);
    Status squashfs(const std::string& chroot, const std::string& out);
    Status erofs(const std::string& chroot, const std::string& out);
    Status xorriso(const std::string& tree, const std::string& out_iso);
    Status implant_isomd5(const std::string& image);

private:
    BuildContext& ctx_;
    const Manifest& manifest_;
};

} // namespace katsu
