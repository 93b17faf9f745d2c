#include "katsu/bootloader.hpp"
#include "katsu/platform.hpp"

#include <spdlog/spdlog.h>

namespace katsu {

BootloaderStager::BootloaderStager(BuildContext& ctx, const Manifest& manifest)
    : ctx_(ctx), manifest_(manifest), arch_(target_arch(manifest)) {}

BootConfigFields BootloaderStager::config_fields() const {
    BootConfigFields fields;
    fields.volid = manifest_.iso.volume_id;
    if (!manifest_.distro.empty()) fields.distro = manifest_.distro;
    fields.cmdline = manifest_.kernel_cmdline;
    return fields;
}

Status BootloaderStager::copy_liveos() {
    spdlog::info("Staging {} boot files", bootloader_to_string(manifest_.bootloader));

    switch (manifest_.bootloader) {
        case Bootloader::Grub: return stage_grub();
        case Bootloader::Limine: return stage_limine();
        case Bootloader::REFInd: return stage_refind();
        case Bootloader::GrubBios:
        case Bootloader::SystemdBoot:
            break;
    }
    return make_error(ErrorKind::ConfigInvalid, std::string("ISO staging is not supported for ") +
                                                    bootloader_to_string(manifest_.bootloader));
}

Status BootloaderStager::install(const std::string& image) {
    switch (manifest_.bootloader) {
        case Bootloader::Limine:
            spdlog::info("Installing Limine to {}", image);
            return ctx_.runner.run(Command{"limine", {"bios-install", image}, {}, true});
        case Bootloader::SystemdBoot:
            spdlog::info("Installing systemd-boot to {}", image);
            return ctx_.runner.run(Command{"bootctl", {"--image=" + image, "install"}, {}, true});
        case Bootloader::GrubBios:
            spdlog::info("Installing GRUB (BIOS) to {}", image);
            return ctx_.runner.run(Command{
                "grub-install", {"--target=i386-pc", "--boot-directory=" + image + "/boot"}, {}, true});
        case Bootloader::Grub:
        case Bootloader::REFInd:
            spdlog::info("{} needs no post-install step", bootloader_to_string(manifest_.bootloader));
            break;
    }
    return ok_status();
}

} // namespace katsu
