#include "katsu/bootloader.hpp"
#include "katsu/digest.hpp"
#include "katsu/platform.hpp"

#include <spdlog/spdlog.h>

namespace katsu {

Status BootloaderStager::stage_limine() {
    const std::string chroot = ctx_.workspace.chroot();
    const std::string boot = join_path(ctx_.workspace.iso_tree(), "boot");

    auto kernel = find_vmlinuz(chroot);
    if (!kernel.ok) return kernel.status;

    Status dir = ensure_directory(boot);
    if (!dir.ok) return dir;

    for (const char* name : {"limine-uefi-cd.bin", "limine-bios-cd.bin", "limine-bios.sys"}) {
        Status copied = copy_tree(join_path(ctx_.host.limine_share, name), join_path(boot, name));
        if (!copied.ok) return copied;
    }

    Status staged = copy_kernel(chroot, ctx_.workspace.iso_tree(), true);
    if (!staged.ok) return staged;

    std::string cfg = join_path(boot, "limine.cfg");
    Status written = atomic_write_file(cfg, render_limine_config(config_fields()));
    if (!written.ok) return written;

    HashResult digest = compute_blake2b512(cfg);
    if (!digest.ok) {
        return make_error(ErrorKind::IoFailure, "failed to hash " + cfg + ": " + digest.error);
    }
    spdlog::debug("limine.cfg BLAKE2b: {}", digest.hex_digest);

    for (const char* name : {"limine-uefi-cd.bin", "limine-bios.sys"}) {
        Status enrolled = ctx_.runner.run(
            Command{"limine", {"enroll-config", join_path(boot, name), digest.hex_digest}, {}, true});
        if (!enrolled.ok) return enrolled;
    }

    return ok_status();
}

} // namespace katsu
