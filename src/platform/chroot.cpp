#include "katsu/chroot.hpp"
#include "katsu/platform.hpp"

#include <filesystem>

namespace katsu {

namespace fs = std::filesystem;

namespace {

struct ChrootMount {
    const char* target;      // relative to the root
    std::vector<std::string> args;  // mount arguments before the target
};

std::vector<ChrootMount> chroot_mounts() {
    return {
        {"proc", {"-t", "proc", "proc"}},
        {"sys", {"-t", "sysfs", "sysfs"}},
        {"dev", {"--bind", "/dev"}},
        {"dev/pts", {"--bind", "/dev/pts"}},
    };
}

} // namespace

ChrootScope::ChrootScope(BuildContext& ctx, std::string root)
    : ctx_(ctx), root_(std::move(root)) {}

ChrootScope::~ChrootScope() {
    if (!mounted_.empty()) {
        Status status = teardown();
        if (!status.ok) {
            spdlog::warn("Failed to tear down chroot {}: {}", root_, status.error);
        }
    }
}

Status ChrootScope::prepare() {
    spdlog::debug("Preparing chroot {}", root_);

    for (const auto& m : chroot_mounts()) {
        std::string target = join_path(root_, m.target);

        Status dir = ensure_directory(target);
        if (!dir.ok) return dir;

        Command cmd{"mount", m.args};
        cmd.args.push_back(target);
        cmd.capture = true;

        Status status = ctx_.runner.run(cmd);
        if (!status.ok) {
            return with_kind(std::move(status), ErrorKind::IoFailure);
        }
        mounted_.push_back(target);
    }

    return copy_resolv_conf();
}

Status ChrootScope::teardown() {
    Status first_failure;

    while (!mounted_.empty()) {
        std::string target = mounted_.back();
        mounted_.pop_back();

        Status status = ctx_.runner.run(Command{"umount", {target}, {}, true});
        if (!status.ok) {
            spdlog::warn("Failed to unmount {}: {}", target, status.stderr_output.empty()
                                                               ? status.error
                                                               : trim(status.stderr_output));
            if (first_failure.ok) first_failure = with_kind(std::move(status), ErrorKind::IoFailure);
        }
    }

    return first_failure;
}

Status ChrootScope::copy_resolv_conf() {
    std::error_code ec;
    if (!fs::exists(ctx_.host.resolv_conf, ec)) {
        spdlog::warn("Host {} not found, name resolution inside the chroot may fail",
                     ctx_.host.resolv_conf);
        return ok_status();
    }

    std::string etc = join_path(root_, "etc");
    Status dir = ensure_directory(etc);
    if (!dir.ok) return dir;

    // The target is often a dangling symlink into the guest's resolver
    std::string target = join_path(etc, "resolv.conf");
    fs::remove(target, ec);

    fs::copy_file(ctx_.host.resolv_conf, target, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return make_error(ErrorKind::IoFailure,
                          "failed to copy " + ctx_.host.resolv_conf + " into " + target + ": " + ec.message());
    }
    return ok_status();
}

std::vector<std::string> unshare_args(const std::string& root, const std::string& program,
                                      const std::vector<std::string>& args) {
    std::vector<std::string> out = {"-R", root, program};
    out.insert(out.end(), args.begin(), args.end());
    return out;
}

} // namespace katsu
