#include "katsu/users.hpp"
#include "katsu/chroot.hpp"
#include "katsu/platform.hpp"

#include <spdlog/spdlog.h>

namespace katsu {

std::vector<std::string> useradd_args(const User& user) {
    std::vector<std::string> args = {user.username};

    if (!user.password.empty()) {
        args.push_back("-p");
        args.push_back(user.password);
    }
    if (!user.groups.empty()) {
        std::string joined;
        for (const auto& g : user.groups) {
            if (!joined.empty()) joined += ",";
            joined += g;
        }
        args.push_back("-G");
        args.push_back(joined);
    }
    if (!user.shell.empty()) {
        args.push_back("-s");
        args.push_back(user.shell);
    }
    if (user.uid) {
        args.push_back("-u");
        args.push_back(std::to_string(*user.uid));
    }
    if (user.gid) {
        args.push_back("-g");
        args.push_back(std::to_string(*user.gid));
    }
    if (user.create_home) {
        args.push_back("-m");
    }
    return args;
}

std::string user_home(const User& user) {
    if (user.username == "root") return "/root";
    return "/home/" + user.username;
}

std::string authorized_keys(const User& user) {
    std::string out;
    for (const auto& key : user.ssh_keys) {
        out += trim(key) + "\n";
    }
    return out;
}

namespace {

Status install_ssh_keys(BuildContext& ctx, const User& user, const std::string& chroot) {
    std::string ssh_dir = path_under_root(chroot, user_home(user) + "/.ssh");
    Status dir = ensure_directory(ssh_dir);
    if (!dir.ok) return dir;

    Status written = atomic_write_file(join_path(ssh_dir, "authorized_keys"), authorized_keys(user), 0600);
    if (!written.ok) return written;

    std::string owner = user.username + ":";
    return ctx.runner.run(Command{
        "unshare", unshare_args(chroot, "chown", {"-R", owner, user_home(user) + "/.ssh"}), {}, true});
}

} // namespace

Status apply_users(BuildContext& ctx, const std::vector<User>& users, const std::string& chroot) {
    if (users.empty()) {
        spdlog::warn("No users specified, the image may not be accessible");
        return ok_status();
    }

    return with_chroot(ctx, chroot, [&]() -> Status {
        for (const auto& user : users) {
            if (user.username.empty()) {
                return make_error(ErrorKind::ConfigInvalid, "user entry without a username");
            }

            // root always exists; only its keys are managed
            if (user.username != "root") {
                spdlog::info("Creating user {}", user.username);
                Status added = ctx.runner.run(
                    Command{"unshare", unshare_args(chroot, "useradd", useradd_args(user)), {}, true});
                if (!added.ok) return added;
            }

            if (!user.ssh_keys.empty()) {
                Status keys = install_ssh_keys(ctx, user, chroot);
                if (!keys.ok) return keys;
            }
        }
        return ok_status();
    });
}

} // namespace katsu
