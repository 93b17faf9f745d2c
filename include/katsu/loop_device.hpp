#pragma once

#include "katsu/process.hpp"
#include "katsu/types.hpp"

#include <string>
#include <vector>

namespace katsu {

// ============================================================================
// LoopDevice
// ============================================================================

// Exclusive handle on a loop device bound to a backing file. The device is
// detached by detach() or by the destructor; repeated detach is harmless.
class LoopDevice {
public:
    explicit LoopDevice(CommandRunner& runner);
    ~LoopDevice();

    LoopDevice(const LoopDevice&) = delete;
    LoopDevice& operator=(const LoopDevice&) = delete;

    // losetup --find --show --partscan <file>
    Status attach(const std::string& backing_file);
    Status detach();

    bool attached() const { return !path_.empty(); }
    const std::string& path() const { return path_; }

private:
    CommandRunner& runner_;
    std::string path_;
};

// ============================================================================
// ScopedMount
// ============================================================================

// A single mount that is unmounted when the object goes out of scope
class ScopedMount {
public:
    explicit ScopedMount(CommandRunner& runner);
    ~ScopedMount();

    ScopedMount(const ScopedMount&) = delete;
    ScopedMount& operator=(const ScopedMount&) = delete;

    // mkdir -p target; mount [options...] source target
    Status mount(const std::string& source, const std::string& target,
                 const std::vector<std::string>& options = {});
    Status unmount();

    bool mounted() const { return !target_.empty(); }
    const std::string& target() const { return target_; }

private:
    CommandRunner& runner_;
    std::string target_;
};

} // namespace katsu
