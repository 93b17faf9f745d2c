#include "katsu/loop_device.hpp"
#include "katsu/platform.hpp"

#include <spdlog/spdlog.h>

namespace katsu {

// ============================================================================
// LoopDevice
// ============================================================================

LoopDevice::LoopDevice(CommandRunner& runner) : runner_(runner) {}

LoopDevice::~LoopDevice() {
    if (attached()) {
        Status status = detach();
        if (!status.ok) {
            spdlog::warn("Failed to detach loop device: {}", status.error);
        }
    }
}

Status LoopDevice::attach(const std::string& backing_file) {
    if (attached()) {
        return make_error(ErrorKind::IoFailure, "loop device already attached at " + path_);
    }

    auto out = runner_.output(Command{"losetup", {"--find", "--show", "--partscan", backing_file}});
    if (!out.ok) {
        return with_kind(out.status, ErrorKind::IoFailure);
    }

    std::string device = trim(out.value);
    if (device.empty()) {
        return make_error(ErrorKind::IoFailure, "losetup did not report a device for " + backing_file);
    }

    path_ = device;
    spdlog::debug("Attached {} to {}", backing_file, path_);
    return ok_status();
}

Status LoopDevice::detach() {
    if (!attached()) return ok_status();

    std::string device = path_;
    path_.clear();

    Status status = runner_.run(Command{"losetup", {"-d", device}, {}, true});
    if (!status.ok) return with_kind(std::move(status), ErrorKind::IoFailure);

    spdlog::debug("Detached {}", device);
    return ok_status();
}

// ============================================================================
// ScopedMount
// ============================================================================

ScopedMount::ScopedMount(CommandRunner& runner) : runner_(runner) {}

ScopedMount::~ScopedMount() {
    if (mounted()) {
        Status status = unmount();
        if (!status.ok) {
            spdlog::warn("Failed to unmount: {}", status.error);
        }
    }
}

Status ScopedMount::mount(const std::string& source, const std::string& target,
                          const std::vector<std::string>& options) {
    if (mounted()) {
        return make_error(ErrorKind::IoFailure, "already mounted at " + target_);
    }

    Status dir = ensure_directory(target);
    if (!dir.ok) return dir;

    Command cmd{"mount", options};
    cmd.args.push_back(source);
    cmd.args.push_back(target);
    cmd.capture = true;

    Status status = runner_.run(cmd);
    if (!status.ok) return with_kind(std::move(status), ErrorKind::IoFailure);

    target_ = target;
    return ok_status();
}

Status ScopedMount::unmount() {
    if (!mounted()) return ok_status();

    std::string target = target_;
    target_.clear();

    Status status = runner_.run(Command{"umount", {target}, {}, true});
    if (!status.ok) return with_kind(std::move(status), ErrorKind::IoFailure);
    return ok_status();
}

} // namespace katsu
