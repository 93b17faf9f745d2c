#include "katsu/platform.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace katsu {

namespace fs = std::filesystem;

namespace {

// fsync a directory by path
bool fsync_directory(const std::string& dir_path) {
    int dir_fd = open(dir_path.c_str(), O_RDONLY | O_DIRECTORY);
    if (dir_fd < 0) return false;

    bool result = fsync(dir_fd) == 0;
    close(dir_fd);
    return result;
}

// Generate a temporary filename next to base
std::string make_temp_filename(const std::string& base) {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::string hex_chars = "0123456789abcdef";
    std::string suffix;
    for (int i = 0; i < 8; ++i) {
        suffix += hex_chars[static_cast<size_t>(dis(gen))];
    }

    return base + ".tmp." + suffix;
}

std::string errno_message(const std::string& what, const std::string& path) {
    return what + " " + path + ": " + std::strerror(errno);
}

} // namespace

Status atomic_write_file(const std::string& path, const std::string& content, unsigned int mode) {
    std::string dir_path = fs::path(path).parent_path().string();
    std::string temp_path = make_temp_filename(path);

    int fd = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, static_cast<mode_t>(mode));
    if (fd < 0) {
        return make_error(ErrorKind::IoFailure, errno_message("failed to create", temp_path));
    }

    ssize_t written = write(fd, content.data(), content.size());
    if (written < 0 || static_cast<size_t>(written) != content.size()) {
        close(fd);
        unlink(temp_path.c_str());
        return make_error(ErrorKind::IoFailure, "failed to write " + temp_path);
    }

    // open() honors the umask; apply the requested bits explicitly
    if (fchmod(fd, static_cast<mode_t>(mode)) != 0 || fsync(fd) != 0) {
        close(fd);
        unlink(temp_path.c_str());
        return make_error(ErrorKind::IoFailure, errno_message("failed to sync", temp_path));
    }

    close(fd);

    if (rename(temp_path.c_str(), path.c_str()) != 0) {
        Status status = make_error(ErrorKind::IoFailure, errno_message("failed to rename onto", path));
        unlink(temp_path.c_str());
        return status;
    }

    if (!dir_path.empty()) {
        fsync_directory(dir_path);
    }

    return ok_status();
}

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) return std::nullopt;
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

Status create_sparse_file(const std::string& path, uint64_t size_bytes) {
    if (size_bytes == 0) {
        return make_error(ErrorKind::ConfigInvalid, "sparse file size must be non-zero: " + path);
    }

    int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        return make_error(ErrorKind::IoFailure, errno_message("failed to create", path));
    }

    const char zero = 0;
    if (lseek(fd, static_cast<off_t>(size_bytes - 1), SEEK_SET) < 0 || write(fd, &zero, 1) != 1) {
        Status status = make_error(ErrorKind::IoFailure, errno_message("failed to extend", path));
        close(fd);
        return status;
    }

    if (close(fd) != 0) {
        return make_error(ErrorKind::IoFailure, errno_message("failed to close", path));
    }
    return ok_status();
}

} // namespace katsu
