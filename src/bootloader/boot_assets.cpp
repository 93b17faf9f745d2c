#include "katsu/bootloader.hpp"
#include "katsu/platform.hpp"

#include <filesystem>

#include <spdlog/spdlog.h>

namespace katsu {

namespace fs = std::filesystem;

Result<ArchInfo> arch_info(const std::string& arch) {
    if (arch == "x86_64") {
        return success(ArchInfo{"x64", "X64", "IA32", "i386-pc", "i386-pc-eltorito", {"biosdisk"}});
    }
    if (arch == "aarch64") {
        return success(ArchInfo{"aa64", "AA64", "ARM", "arm64-efi", "arm64-efi", {"efi_gop"}});
    }
    return failure<ArchInfo>(ErrorKind::UnsupportedArch, "unsupported architecture '" + arch + "'");
}

Result<KernelImage> find_vmlinuz(const std::string& chroot) {
    std::string modules = join_path(chroot, "usr/lib/modules");

    std::vector<std::string> versions;
    for (const auto& name : list_directory_names(modules)) {
        std::error_code ec;
        if (fs::is_directory(join_path(modules, name), ec)) versions.push_back(name);
    }
    if (versions.empty()) {
        return failure<KernelImage>(ErrorKind::ResourceMissing, "no kernel found in " + modules);
    }

    KernelImage kernel;
    kernel.version = versions.front();
    kernel.path = join_path(join_path(modules, kernel.version), "vmlinuz");

    std::error_code ec;
    if (!fs::is_regular_file(kernel.path, ec)) {
        return failure<KernelImage>(ErrorKind::ResourceMissing, "kernel image missing: " + kernel.path);
    }

    spdlog::debug("Found kernel {} at {}", kernel.version, kernel.path);
    return success(std::move(kernel));
}

Result<std::string> find_initramfs(const std::string& chroot) {
    std::string boot = join_path(chroot, "boot");

    for (const auto& name : list_directory_names(boot)) {
        bool candidate = name == "initramfs.img" || name.rfind("initramfs-", 0) == 0;
        if (!candidate || name.find("-rescue-") != std::string::npos) continue;

        std::string path = join_path(boot, name);
        std::error_code ec;
        if (fs::is_regular_file(path, ec)) {
            spdlog::debug("Found initramfs {}", path);
            return success(path);
        }
    }

    return failure<std::string>(ErrorKind::ResourceMissing, "no initramfs found in " + boot);
}

Status copy_kernel(const std::string& chroot, const std::string& dest, bool copy_initramfs) {
    auto kernel = find_vmlinuz(chroot);
    if (!kernel.ok) return kernel.status;

    std::string boot = join_path(dest, "boot");
    Status dir = ensure_directory(boot);
    if (!dir.ok) return dir;

    Status copied = copy_tree(kernel.value.path, join_path(boot, "vmlinuz"));
    if (!copied.ok) return copied;

    if (copy_initramfs) {
        auto initramfs = find_initramfs(chroot);
        if (!initramfs.ok) return initramfs.status;

        Status copied_initramfs = copy_tree(initramfs.value, join_path(boot, "initramfs.img"));
        if (!copied_initramfs.ok) return copied_initramfs;
    }

    return ok_status();
}

Result<BootBinaries> boot_binaries(Bootloader bootloader) {
    switch (bootloader) {
        case Bootloader::Grub:
            return success(BootBinaries{"boot/efiboot.img", "boot/eltorito.img"});
        case Bootloader::Limine:
            return success(BootBinaries{"boot/limine-uefi-cd.bin", "boot/limine-bios-cd.bin"});
        case Bootloader::REFInd:
            return success(BootBinaries{"boot/efiboot.img", ""});
        case Bootloader::GrubBios:
        case Bootloader::SystemdBoot:
            break;
    }
    return failure<BootBinaries>(ErrorKind::ConfigInvalid,
                                 std::string("bootloader ") + bootloader_to_string(bootloader) +
                                     " is not supported for ISO images");
}

} // namespace katsu
