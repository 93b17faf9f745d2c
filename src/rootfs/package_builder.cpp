#include "katsu/chroot.hpp"
#include "katsu/partition.hpp"
#include "katsu/platform.hpp"
#include "katsu/root_builder.hpp"
#include "katsu/scripts.hpp"
#include "katsu/users.hpp"

#include <spdlog/spdlog.h>

namespace katsu {

std::vector<std::string> PackageRootBuilder::install_args(const DnfOptions& dnf, const std::string& chroot,
                                                          const std::string& arch) {
    std::vector<std::string> args = dnf.global_options;

    args.push_back("install");
    args.push_back("-y");
    args.push_back("--installroot=" + chroot);
    if (!dnf.releasever.empty()) args.push_back("--releasever=" + dnf.releasever);
    if (dnf.arch) args.push_back("--forcearch=" + *dnf.arch);
    if (!dnf.repodir.empty()) args.push_back("--setopt=reposdir=" + dnf.repodir);

    args.insert(args.end(), dnf.packages.begin(), dnf.packages.end());
    auto arch_pkgs = dnf.arch_packages.find(arch);
    if (arch_pkgs != dnf.arch_packages.end()) {
        args.insert(args.end(), arch_pkgs->second.begin(), arch_pkgs->second.end());
    }

    args.insert(args.end(), dnf.options.begin(), dnf.options.end());

    for (const auto& pkg : dnf.exclude) {
        args.push_back("--exclude=" + pkg);
    }
    auto arch_excl = dnf.arch_exclude.find(arch);
    if (arch_excl != dnf.arch_exclude.end()) {
        for (const auto& pkg : arch_excl->second) {
            args.push_back("--exclude=" + pkg);
        }
    }

    return args;
}

Result<TreeOutput> PackageRootBuilder::build(BuildContext& ctx, const std::string& chroot,
                                             const Manifest& manifest) const {
    std::string arch = target_arch(manifest);
    ScriptRunner scripts(ctx);

    Status dir = ensure_directory(chroot);
    if (!dir.ok) return failure<TreeOutput>(dir);

    Status pre = scripts.run_all(manifest.pre_scripts, chroot, false);
    if (!pre.ok) return failure<TreeOutput>(pre);

    if (manifest.disk) {
        PartitionEngine engine(ctx, *manifest.disk, arch);
        auto fstab = engine.fstab(chroot);
        if (!fstab.ok) return failure<TreeOutput>(fstab.status);

        Status etc = ensure_directory(join_path(chroot, "etc"));
        if (!etc.ok) return failure<TreeOutput>(etc);

        Status written = atomic_write_file(join_path(chroot, "etc/fstab"), fstab.value);
        if (!written.ok) return failure<TreeOutput>(written);
    }

    spdlog::info("Installing packages into {}", chroot);
    Status installed = with_chroot(ctx, chroot, [&]() {
        return ctx.runner.run(Command{manifest.dnf.exec, install_args(manifest.dnf, chroot, arch)});
    });
    if (!installed.ok) return failure<TreeOutput>(installed);

    Status cleaned = ctx.runner.run(
        Command{manifest.dnf.exec, {"clean", "all", "--installroot=" + chroot}, {}, true});
    if (!cleaned.ok) {
        spdlog::warn("{} clean all failed: {}", manifest.dnf.exec, cleaned.error);
    }

    Status users = apply_users(ctx, manifest.users, chroot);
    if (!users.ok) return failure<TreeOutput>(users);

    if (manifest.bootloader == Bootloader::Grub || manifest.bootloader == Bootloader::GrubBios) {
        Status grub = with_chroot(ctx, chroot, [&]() {
            return ctx.runner.run(Command{
                "unshare", unshare_args(chroot, "grub2-mkconfig", {"-o", "/boot/grub2/grub.cfg"}), {}, true});
        });
        if (!grub.ok) {
            spdlog::warn("grub2-mkconfig failed inside the chroot, continuing: {}", grub.error);
        }
    }

    Status post = scripts.run_all(manifest.post_scripts, chroot, true);
    if (!post.ok) return failure<TreeOutput>(post);

    return success(TreeOutput{TreeOutputKind::Directory, chroot});
}

} // namespace katsu
