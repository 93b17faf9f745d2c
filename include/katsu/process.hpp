/*
 * Katsu Process - external command execution
 *
 * Every external tool (dnf, podman, parted, mkfs.*, mount, xorriso, ...)
 * is invoked through a CommandRunner so that callers can be exercised
 * against a recording implementation.
 */

#pragma once

#include "katsu/types.hpp"

#include <string>
#include <utility>
#include <vector>

namespace katsu {

// ============================================================================
// Command
// ============================================================================

struct Command {
    std::string program;                                     // resolved through PATH
    std::vector<std::string> args;
    std::vector<std::pair<std::string, std::string>> env;    // added to the inherited environment
    bool capture = false;                                    // buffer stdout/stderr instead of inheriting
};

// Shell-like rendering for logs and error messages
std::string format_command(const Command& cmd);

// ============================================================================
// Execution Result
// ============================================================================

struct ExecResult {
    bool ok = false;          // process was spawned and reaped
    int exit_code = -1;       // 128 + signal when killed by a signal
    std::string stdout_output;
    std::string stderr_output;
    std::string error;        // spawn/wait failure description
};

// ============================================================================
// Runner Interface
// ============================================================================

class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    // Spawn the command and wait for it
    virtual ExecResult execute(const Command& cmd) = 0;

    // Execute and map spawn failures and non-zero exits to ExternalFailure
    Status run(const Command& cmd);

    // Execute with capture forced on; value is stdout
    Result<std::string> output(const Command& cmd);
};

// fork/execvp based runner
class SystemRunner : public CommandRunner {
public:
    ExecResult execute(const Command& cmd) override;
};

} // namespace katsu
