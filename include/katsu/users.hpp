#pragma once

#include "katsu/context.hpp"
#include "katsu/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace katsu {

struct User {
    std::string username;
    std::string password;                 // pre-hashed, passed to useradd -p
    std::vector<std::string> groups;
    bool create_home = true;
    std::string shell;
    std::optional<uint32_t> uid;
    std::optional<uint32_t> gid;
    std::vector<std::string> ssh_keys;
};

// useradd arguments (without the program name)
std::vector<std::string> useradd_args(const User& user);

// Home directory inside the image
std::string user_home(const User& user);

// authorized_keys content, one key per line
std::string authorized_keys(const User& user);

// Create every user inside chroot and install their SSH keys
Status apply_users(BuildContext& ctx, const std::vector<User>& users, const std::string& chroot);

} // namespace katsu
