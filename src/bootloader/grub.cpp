#include "katsu/bootloader.hpp"
#include "katsu/loop_device.hpp"
#include "katsu/platform.hpp"

#include <filesystem>

#include <spdlog/spdlog.h>

namespace katsu {

namespace fs = std::filesystem;

namespace {

bool exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

// Vendor directory below boot/efi/EFI, preferring fedora
Result<std::string> find_vendor_efi_dir(const std::string& efi_root) {
    auto names = list_directory_names(efi_root);
    for (const auto& name : names) {
        if (name == "fedora") return success(join_path(efi_root, name));
    }
    for (const auto& name : names) {
        std::error_code ec;
        if (name != "BOOT" && fs::is_directory(join_path(efi_root, name), ec)) {
            return success(join_path(efi_root, name));
        }
    }
    return failure<std::string>(ErrorKind::ResourceMissing, "no vendor EFI directory in " + efi_root);
}

Status populate_efi_boot(const std::string& tree, const std::string& chroot, const ArchInfo& arch) {
    std::string efi_boot = join_path(tree, "EFI/BOOT");

    Status cleared = remove_tree(efi_boot);
    if (!cleared.ok) return cleared;
    Status dir = ensure_directory(join_path(efi_boot, "fonts"));
    if (!dir.ok) return dir;

    auto vendor = find_vendor_efi_dir(join_path(tree, "boot/efi/EFI"));
    if (!vendor.ok) return vendor.status;

    Status copied = copy_tree(vendor.value, efi_boot);
    if (!copied.ok) return copied;

    std::string cfg = join_path(tree, "boot/grub/grub.cfg");
    for (const char* name : {"BOOT.conf", "grub.cfg"}) {
        Status c = copy_tree(cfg, join_path(efi_boot, name));
        if (!c.ok) return c;
    }

    std::string font = join_path(tree, "boot/grub/fonts/unicode.pf2");
    if (!exists(font)) font = join_path(chroot, "usr/share/grub/unicode.pf2");
    Status font_copied = copy_tree(font, join_path(efi_boot, "fonts/unicode.pf2"));
    if (!font_copied.ok) return font_copied;

    std::string shim = join_path(efi_boot, "shim" + arch.short_name + ".efi");
    Status primary = copy_tree(shim, join_path(efi_boot, "BOOT" + arch.short_upper + ".EFI"));
    if (!primary.ok) return primary;

    std::string legacy_shim = join_path(efi_boot, "shim.efi");
    if (exists(legacy_shim)) {
        Status legacy = copy_tree(legacy_shim, join_path(efi_boot, "BOOT" + arch.legacy + ".EFI"));
        if (!legacy.ok) return legacy;
    } else {
        spdlog::warn("{} not found, skipping BOOT{}.EFI", legacy_shim, arch.legacy);
    }

    return ok_status();
}

Status build_eltorito(BuildContext& ctx, const std::string& tree, const std::string& chroot,
                      const ArchInfo& arch) {
    std::vector<std::string> args = {
        "-O", arch.grub_image_format,
        "-d", join_path(chroot, "usr/lib/grub/" + arch.grub_platform),
        "-o", join_path(tree, "boot/eltorito.img"),
        "-p", "/boot/grub",
        "iso9660",
    };
    args.insert(args.end(), arch.extra_modules.begin(), arch.extra_modules.end());

    spdlog::info("Building El Torito image");
    return ctx.runner.run(Command{"grub2-mkimage", args, {}, true});
}

// Merge the module tree of a grub2-mkrescue image into the ISO tree
Status merge_rescue_modules(BuildContext& ctx, const std::string& tree) {
    std::string rescue = join_path(ctx.workspace.root, "efiboot.img");

    Status built = ctx.runner.run(Command{"grub2-mkrescue", {"-o", rescue}, {}, true});
    if (!built.ok) return built;

    LoopDevice loop(ctx.runner);
    Status attached = loop.attach(rescue);
    if (!attached.ok) return attached;

    ScopedMount mnt(ctx.runner);
    Status mounted = mnt.mount(loop.path(), ctx.host.rescue_mount);
    if (!mounted.ok) return mounted;

    Status copied = copy_tree_missing(join_path(mnt.target(), "boot/grub"), join_path(tree, "boot/grub"));
    if (!copied.ok) return copied;

    Status unmounted = mnt.unmount();
    if (!unmounted.ok) return unmounted;
    return loop.detach();
}

} // namespace

Status BootloaderStager::stage_grub() {
    auto arch = arch_info(arch_);
    if (!arch.ok) return arch.status;

    const std::string chroot = ctx_.workspace.chroot();
    const std::string tree = ctx_.workspace.iso_tree();
    const std::string images = ctx_.workspace.boot_images();

    // Discover before touching the tree so a missing kernel leaves it intact
    auto kernel = find_vmlinuz(chroot);
    if (!kernel.ok) return kernel.status;
    auto initramfs = find_initramfs(chroot);
    if (!initramfs.ok) return initramfs.status;

    std::string grub_src = join_path(chroot, "boot/grub2");
    if (!exists(grub_src)) grub_src = join_path(chroot, "boot/grub");
    if (!exists(grub_src)) {
        return make_error(ErrorKind::ResourceMissing, "Missing grub directory in " + chroot + "/boot");
    }

    Status dir = ensure_directory(images);
    if (!dir.ok) return dir;

    if (arch_ == "x86_64") {
        std::string hybrid = join_path(chroot, "usr/lib/grub/i386-pc/boot_hybrid.img");
        if (exists(hybrid)) {
            Status copied = copy_tree(hybrid, join_path(images, "boot_hybrid.img"));
            if (!copied.ok) return copied;
        } else {
            spdlog::warn("{} not found, the ISO will not be BIOS-bootable from USB", hybrid);
        }
    }

    Status staged = copy_kernel(chroot, images, true);
    if (!staged.ok) return staged;

    std::string boot = join_path(tree, "boot");
    Status cleared = remove_tree(boot);
    if (!cleared.ok) return cleared;
    dir = ensure_directory(boot);
    if (!dir.ok) return dir;

    Status grub = copy_tree(grub_src, join_path(boot, "grub"));
    if (!grub.ok) return grub;

    std::string efi_src = join_path(chroot, "boot/efi");
    if (exists(efi_src)) {
        Status efi = copy_tree(efi_src, join_path(boot, "efi"));
        if (!efi.ok) return efi;
    } else {
        spdlog::warn("{} not found", efi_src);
    }

    for (const char* name : {"vmlinuz", "initramfs.img"}) {
        Status c = copy_tree(join_path(images, std::string("boot/") + name), join_path(boot, name));
        if (!c.ok) return c;
    }

    Status cfg = atomic_write_file(join_path(boot, "grub/grub.cfg"), render_grub_config(config_fields()));
    if (!cfg.ok) return cfg;

    Status efi_boot = populate_efi_boot(tree, chroot, arch.value);
    if (!efi_boot.ok) return efi_boot;

    Status eltorito = build_eltorito(ctx_, tree, chroot, arch.value);
    if (!eltorito.ok) return eltorito;

    Status rescue = merge_rescue_modules(ctx_, tree);
    if (!rescue.ok) return rescue;

    return build_efi_image(ctx_, tree, GRUB_EFI_IMAGE_SIZE, false);
}

} // namespace katsu
