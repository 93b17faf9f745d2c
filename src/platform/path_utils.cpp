#include "katsu/platform.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

#include <sys/utsname.h>

namespace katsu {

namespace fs = std::filesystem;

namespace {

Status copy_tree_impl(const std::string& src, const std::string& dst, fs::copy_options existing) {
    std::error_code ec;
    if (!fs::exists(src, ec)) {
        return make_error(ErrorKind::ResourceMissing, "no such file or directory: " + src);
    }

    if (fs::is_directory(src)) {
        fs::create_directories(dst, ec);
        if (ec) {
            return make_error(ErrorKind::IoFailure, "failed to create " + dst + ": " + ec.message());
        }
        fs::copy(src, dst, fs::copy_options::recursive | existing, ec);
    } else {
        fs::path parent = fs::path(dst).parent_path();
        if (!parent.empty()) fs::create_directories(parent, ec);
        fs::copy_file(src, dst, existing, ec);
    }

    if (ec) {
        return make_error(ErrorKind::IoFailure,
                          "failed to copy " + src + " to " + dst + ": " + ec.message());
    }
    return ok_status();
}

} // namespace

Status copy_tree(const std::string& src, const std::string& dst) {
    return copy_tree_impl(src, dst, fs::copy_options::overwrite_existing);
}

Status copy_tree_missing(const std::string& src, const std::string& dst) {
    return copy_tree_impl(src, dst, fs::copy_options::skip_existing);
}

Status ensure_directory(const std::string& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        return make_error(ErrorKind::IoFailure, "failed to create " + path + ": " + ec.message());
    }
    return ok_status();
}

Status remove_tree(const std::string& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        return make_error(ErrorKind::IoFailure, "failed to remove " + path + ": " + ec.message());
    }
    return ok_status();
}

std::string path_under_root(const std::string& root, const std::string& abs_path) {
    std::string rel = abs_path;
    while (!rel.empty() && rel.front() == '/') rel.erase(rel.begin());
    while (!rel.empty() && rel.back() == '/') rel.pop_back();
    if (rel.empty()) return root;
    return (fs::path(root) / rel).string();
}

std::string join_path(const std::string& base, const std::string& rel) {
    fs::path p(base);
    p /= rel;
    return p.string();
}

std::vector<std::string> list_directory_names(const std::string& dir) {
    std::vector<std::string> names;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return names;

    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        names.push_back(entry.path().filename().string());
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::string host_arch() {
    struct utsname info {};
    if (uname(&info) != 0) return "";
    return info.machine;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::vector<std::string> split_list(const std::string& s, char delim) {
    std::vector<std::string> parts;
    std::string current;
    std::istringstream ss(s);
    while (std::getline(ss, current, delim)) {
        std::string item = trim(current);
        if (!item.empty()) parts.push_back(item);
    }
    return parts;
}

} // namespace katsu
