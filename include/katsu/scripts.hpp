#pragma once

#include "katsu/context.hpp"
#include "katsu/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace katsu {

// ============================================================================
// Script
// ============================================================================

struct Script {
    std::string id;                     // generated from the body when empty
    std::string name;                   // display name
    std::string file;                   // path to the script body
    std::string inline_body;            // takes precedence over file
    std::optional<bool> in_chroot;      // overrides the caller's default
    std::vector<std::string> needs;     // ids that must run first
    int priority = 50;                  // higher runs later among peers
};

// Effective id: the declared id, or "anon-<hash>" of the script source
std::string script_id(const Script& script);

// Script display name for logs
std::string script_label(const Script& script);

// Body with "#!/bin/sh\n" prepended when it has no shebang
Result<std::string> load_script_body(const Script& script);

// Execution order as indices into scripts. Peers are ordered by priority
// (stable, so declaration order breaks ties); every script follows all of
// its transitive needs. Missing needs, duplicate ids and cycles are
// ConfigInvalid.
Result<std::vector<size_t>> resolve_script_order(const std::vector<Script>& scripts);

// ============================================================================
// Script Runner
// ============================================================================

class ScriptRunner {
public:
    explicit ScriptRunner(BuildContext& ctx);

    // Run every script once in resolved order. in_chroot is the default
    // for scripts that do not set their own flag.
    Status run_all(const std::vector<Script>& scripts, const std::string& chroot, bool in_chroot);

private:
    Status run_one(const Script& script, const std::string& chroot, bool in_chroot);

    BuildContext& ctx_;
};

} // namespace katsu
