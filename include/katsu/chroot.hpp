#pragma once

#include "katsu/context.hpp"
#include "katsu/types.hpp"

#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace katsu {

// ============================================================================
// ChrootScope
// ============================================================================

// Mounts /proc, /sys, /dev and /dev/pts into a target root and copies the
// host resolv.conf. Teardown unmounts in reverse order, runs from the
// destructor as well, and is a no-op when nothing is mounted.
class ChrootScope {
public:
    ChrootScope(BuildContext& ctx, std::string root);
    ~ChrootScope();

    ChrootScope(const ChrootScope&) = delete;
    ChrootScope& operator=(const ChrootScope&) = delete;

    Status prepare();
    Status teardown();

    const std::string& root() const { return root_; }
    const std::vector<std::string>& mounted() const { return mounted_; }

private:
    Status copy_resolv_conf();

    BuildContext& ctx_;
    std::string root_;
    std::vector<std::string> mounted_;
};

// Run body between prepare and teardown. Teardown always runs; its failure
// is logged and reported only when body succeeded.
template <typename F>
Status with_chroot(BuildContext& ctx, const std::string& root, F&& body) {
    ChrootScope scope(ctx, root);

    Status prepared = scope.prepare();
    if (!prepared.ok) {
        scope.teardown();
        return prepared;
    }

    Status result = std::forward<F>(body)();
    Status torn = scope.teardown();

    if (!result.ok) {
        if (!torn.ok) spdlog::error("chroot teardown failed: {}", torn.error);
        return result;
    }
    return torn;
}

// Argument vector for running a program inside root via unshare -R
std::vector<std::string> unshare_args(const std::string& root, const std::string& program,
                                      const std::vector<std::string>& args = {});

} // namespace katsu
