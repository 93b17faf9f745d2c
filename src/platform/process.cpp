#include "katsu/process.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace katsu {

namespace {

bool needs_quoting(const std::string& arg) {
    if (arg.empty()) return true;
    for (char c : arg) {
        if (c == ' ' || c == '\t' || c == '"' || c == '\'' || c == '\\' || c == '$' ||
            c == '`' || c == '|' || c == '&' || c == ';' || c == '<' || c == '>' ||
            c == '(' || c == ')' || c == '*' || c == '?' || c == '[' || c == ']' ||
            c == '{' || c == '}') {
            return true;
        }
    }
    return false;
}

std::string quote(const std::string& arg) {
    if (!needs_quoting(arg)) return arg;
    std::string out = "'";
    for (char c : arg) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

// Drain both pipes until EOF without letting either fill up
void read_pipes(int out_fd, int err_fd, std::string& out, std::string& err) {
    struct pollfd fds[2];
    fds[0] = {out_fd, POLLIN, 0};
    fds[1] = {err_fd, POLLIN, 0};
    int open_count = 2;
    char buffer[8192];

    while (open_count > 0) {
        if (poll(fds, 2, -1) < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0) continue;
            if (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) {
                ssize_t n = read(fds[i].fd, buffer, sizeof(buffer));
                if (n > 0) {
                    (i == 0 ? out : err).append(buffer, static_cast<size_t>(n));
                } else if (n == 0 || errno != EINTR) {
                    fds[i].fd = -1;
                    --open_count;
                }
            }
        }
    }
}

} // namespace

std::string format_command(const Command& cmd) {
    std::string line;
    for (const auto& [key, value] : cmd.env) {
        line += key + "=" + quote(value) + " ";
    }
    line += quote(cmd.program);
    for (const auto& arg : cmd.args) {
        line += " " + quote(arg);
    }
    return line;
}

// ============================================================================
// CommandRunner
// ============================================================================

Status CommandRunner::run(const Command& cmd) {
    std::string line = format_command(cmd);
    spdlog::debug("$ {}", line);

    ExecResult exec = execute(cmd);

    if (!exec.ok) {
        Status status = make_error(ErrorKind::ExternalFailure,
                                   "failed to run " + cmd.program + ": " + exec.error);
        status.command = line;
        status.exit_code = exec.exit_code;
        return status;
    }

    if (exec.exit_code != 0) {
        Status status = make_error(ErrorKind::ExternalFailure,
                                   cmd.program + " exited with status " + std::to_string(exec.exit_code));
        status.command = line;
        status.exit_code = exec.exit_code;
        status.stdout_output = std::move(exec.stdout_output);
        status.stderr_output = std::move(exec.stderr_output);
        return status;
    }

    return ok_status();
}

Result<std::string> CommandRunner::output(const Command& cmd) {
    Command captured = cmd;
    captured.capture = true;

    std::string line = format_command(captured);
    spdlog::debug("$ {}", line);

    ExecResult exec = execute(captured);
    if (!exec.ok || exec.exit_code != 0) {
        Status status = make_error(ErrorKind::ExternalFailure,
                                   exec.ok ? cmd.program + " exited with status " + std::to_string(exec.exit_code)
                                           : "failed to run " + cmd.program + ": " + exec.error);
        status.command = line;
        status.exit_code = exec.exit_code;
        status.stdout_output = std::move(exec.stdout_output);
        status.stderr_output = std::move(exec.stderr_output);
        return failure<std::string>(std::move(status));
    }

    return success(std::move(exec.stdout_output));
}

// ============================================================================
// SystemRunner
// ============================================================================

ExecResult SystemRunner::execute(const Command& cmd) {
    ExecResult result;

    std::vector<std::string> argv_strings;
    argv_strings.push_back(cmd.program);
    argv_strings.insert(argv_strings.end(), cmd.args.begin(), cmd.args.end());

    std::vector<char*> argv;
    for (auto& s : argv_strings) {
        argv.push_back(const_cast<char*>(s.c_str()));
    }
    argv.push_back(nullptr);

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (cmd.capture) {
        if (pipe2(out_pipe, O_CLOEXEC) != 0 || pipe2(err_pipe, O_CLOEXEC) != 0) {
            result.error = "pipe failed: " + std::string(strerror(errno));
            for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) {
                if (fd >= 0) close(fd);
            }
            return result;
        }
    }

    pid_t pid = fork();

    if (pid == -1) {
        result.error = "fork failed: " + std::string(strerror(errno));
        if (cmd.capture) {
            close(out_pipe[0]); close(out_pipe[1]);
            close(err_pipe[0]); close(err_pipe[1]);
        }
        return result;
    }

    if (pid == 0) {
        // Child process
        if (cmd.capture) {
            dup2(out_pipe[1], STDOUT_FILENO);
            dup2(err_pipe[1], STDERR_FILENO);
        }
        for (const auto& [key, value] : cmd.env) {
            setenv(key.c_str(), value.c_str(), 1);
        }

        execvp(cmd.program.c_str(), argv.data());

        // If execvp returns, it failed
        _exit(127);
    }

    // Parent process
    if (cmd.capture) {
        close(out_pipe[1]);
        close(err_pipe[1]);
        read_pipes(out_pipe[0], err_pipe[0], result.stdout_output, result.stderr_output);
        close(out_pipe[0]);
        close(err_pipe[0]);
    }

    int status;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            result.error = "waitpid failed: " + std::string(strerror(errno));
            return result;
        }
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
        result.ok = true;
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
        result.ok = true;
    } else {
        result.error = "process terminated abnormally";
    }

    return result;
}

} // namespace katsu
