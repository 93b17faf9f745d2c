/**
 * Katsu CLI - Common utilities and types
 */

#pragma once

#include <katsu/types.hpp>

#include <string>

namespace katsu::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    bool verbose = false;          // -v, --verbose
    std::string workspace;         // --workspace
};

/**
 * Process exit code for a failed status: the external command's own
 * exit code when there is one, otherwise 1.
 */
inline int exit_code_for(const Status& status) {
    if (status.ok) return 0;
    if (status.exit_code > 0 && status.exit_code < 256) return status.exit_code;
    return 1;
}

} // namespace katsu::cli
