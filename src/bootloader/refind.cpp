#include "katsu/bootloader.hpp"
#include "katsu/platform.hpp"

namespace katsu {

Status BootloaderStager::stage_refind() {
    if (arch_ != "x86_64") {
        return make_error(ErrorKind::UnsupportedArch, "rEFInd images are only built for x86_64, not " + arch_);
    }

    const std::string chroot = ctx_.workspace.chroot();
    const std::string tree = ctx_.workspace.iso_tree();
    const std::string share = ctx_.host.refind_share;
    const std::string efi_boot = join_path(tree, "EFI/BOOT");

    auto kernel = find_vmlinuz(chroot);
    if (!kernel.ok) return kernel.status;
    auto initramfs = find_initramfs(chroot);
    if (!initramfs.ok) return initramfs.status;

    Status dir = ensure_directory(join_path(efi_boot, "drivers_x64"));
    if (!dir.ok) return dir;

    Status loader = copy_tree(join_path(share, "refind_x64.efi"), join_path(efi_boot, "BOOTX64.EFI"));
    if (!loader.ok) return loader;

    for (const char* driver : {"iso9660_x64.efi", "ext4_x64.efi"}) {
        Status copied = copy_tree(join_path(share, std::string("drivers_x64/") + driver),
                                  join_path(efi_boot, std::string("drivers_x64/") + driver));
        if (!copied.ok) return copied;
    }

    Status icons = copy_tree(join_path(share, "icons"), join_path(efi_boot, "icons"));
    if (!icons.ok) return icons;

    Status staged = copy_kernel(chroot, tree, true);
    if (!staged.ok) return staged;

    Status cfg = atomic_write_file(join_path(efi_boot, "refind.conf"), render_refind_config(config_fields()));
    if (!cfg.ok) return cfg;

    Status nsh = atomic_write_file(join_path(tree, "startup.nsh"), "EFI\\BOOT\\BOOTX64.EFI\n");
    if (!nsh.ok) return nsh;

    return build_efi_image(ctx_, tree, REFIND_EFI_IMAGE_SIZE, true);
}

} // namespace katsu
