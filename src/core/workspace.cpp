#include "katsu/context.hpp"
#include "katsu/platform.hpp"

#include <filesystem>
#include <system_error>

namespace katsu {

namespace fs = std::filesystem;

Status Workspace::create() {
    // dnf --installroot, container storage and CHROOT for scripts need an absolute root
    std::error_code ec;
    fs::path absolute = fs::absolute(root, ec);
    if (ec) {
        return make_error(ErrorKind::IoFailure, "Failed to resolve workspace " + root + ": " + ec.message());
    }
    root = absolute.lexically_normal().string();
    while (root.size() > 1 && root.back() == '/') root.pop_back();

    for (const auto& dir : {root, chroot(), iso_tree(), image_dir()}) {
        Status status = ensure_directory(dir);
        if (!status.ok) return status;
    }
    return ok_status();
}

} // namespace katsu
