#include "katsu/bootloader.hpp"
#include "katsu/loop_device.hpp"
#include "katsu/platform.hpp"

#include <spdlog/spdlog.h>

namespace katsu {

Status build_efi_image(BuildContext& ctx, const std::string& tree, uint64_t size, bool include_kernel) {
    std::string image = join_path(tree, "boot/efiboot.img");
    spdlog::info("Building EFI boot image {}", image);

    Status dir = ensure_directory(join_path(tree, "boot"));
    if (!dir.ok) return dir;

    Status created = create_sparse_file(image, size);
    if (!created.ok) return created;

    LoopDevice loop(ctx.runner);
    Status attached = loop.attach(image);
    if (!attached.ok) return attached;

    Status formatted = ctx.runner.run(Command{"mkfs.msdos", {"-v", "-n", "EFI", loop.path()}, {}, true});
    if (!formatted.ok) return formatted;

    ScopedMount mnt(ctx.runner);
    Status mounted = mnt.mount(loop.path(), ctx.host.efiboot_mount);
    if (!mounted.ok) return mounted;

    Status copied = copy_tree(join_path(tree, "EFI/BOOT"), join_path(mnt.target(), "EFI/BOOT"));
    if (!copied.ok) return copied;

    if (include_kernel) {
        for (const char* name : {"boot/vmlinuz", "boot/initramfs.img"}) {
            Status file = copy_tree(join_path(tree, name), join_path(mnt.target(), name));
            if (!file.ok) return file;
        }
    }

    Status unmounted = mnt.unmount();
    if (!unmounted.ok) return unmounted;

    return loop.detach();
}

} // namespace katsu
