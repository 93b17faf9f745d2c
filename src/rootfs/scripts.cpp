#include "katsu/scripts.hpp"
#include "katsu/chroot.hpp"
#include "katsu/platform.hpp"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <functional>
#include <unordered_map>

#include <spdlog/spdlog.h>

namespace katsu {

namespace {

enum class VisitState { Unvisited, Visiting, Done };

std::string hex_hash(const std::string& s) {
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016zx", std::hash<std::string>{}(s));
    return buf;
}

} // namespace

std::string script_id(const Script& script) {
    if (!script.id.empty()) return script.id;
    return "anon-" + hex_hash(script.file + "\n" + script.inline_body);
}

std::string script_label(const Script& script) {
    if (!script.name.empty()) return script.name;
    return script_id(script);
}

Result<std::string> load_script_body(const Script& script) {
    std::string body;

    if (!script.inline_body.empty()) {
        body = script.inline_body;
    } else if (!script.file.empty()) {
        auto content = read_file(script.file);
        if (!content) {
            return failure<std::string>(ErrorKind::ResourceMissing, "cannot read script file " + script.file);
        }
        body = std::move(*content);
    } else {
        return failure<std::string>(ErrorKind::ConfigInvalid,
                                    "script " + script_label(script) + " has neither file nor inline body");
    }

    if (body.rfind("#!", 0) != 0) {
        body = "#!/bin/sh\n" + body;
    }
    return success(std::move(body));
}

Result<std::vector<size_t>> resolve_script_order(const std::vector<Script>& scripts) {
    std::unordered_map<std::string, size_t> by_id;
    for (size_t i = 0; i < scripts.size(); ++i) {
        std::string id = script_id(scripts[i]);
        if (!by_id.emplace(id, i).second) {
            return failure<std::vector<size_t>>(ErrorKind::ConfigInvalid, "duplicate script id `" + id + "`");
        }
    }

    std::vector<size_t> peers(scripts.size());
    for (size_t i = 0; i < peers.size(); ++i) peers[i] = i;
    std::stable_sort(peers.begin(), peers.end(), [&scripts](size_t a, size_t b) {
        return scripts[a].priority < scripts[b].priority;
    });

    std::vector<VisitState> state(scripts.size(), VisitState::Unvisited);
    std::vector<size_t> order;
    Status error;

    std::function<bool(size_t)> visit = [&](size_t i) -> bool {
        if (state[i] == VisitState::Done) return true;
        if (state[i] == VisitState::Visiting) {
            error = make_error(ErrorKind::ConfigInvalid,
                               "script dependency cycle through `" + script_id(scripts[i]) + "`");
            return false;
        }

        state[i] = VisitState::Visiting;
        for (const auto& need : scripts[i].needs) {
            auto it = by_id.find(need);
            if (it == by_id.end()) {
                error = make_error(ErrorKind::ConfigInvalid, "Script `" + need + "` required by `" +
                                                                 script_id(scripts[i]) + "` not found");
                return false;
            }
            if (!visit(it->second)) return false;
        }
        state[i] = VisitState::Done;
        order.push_back(i);
        return true;
    };

    for (size_t i : peers) {
        if (!visit(i)) return failure<std::vector<size_t>>(error);
    }

    return success(std::move(order));
}

// ============================================================================
// Script Runner
// ============================================================================

ScriptRunner::ScriptRunner(BuildContext& ctx) : ctx_(ctx) {}

Status ScriptRunner::run_all(const std::vector<Script>& scripts, const std::string& chroot, bool in_chroot) {
    if (scripts.empty()) return ok_status();

    auto order = resolve_script_order(scripts);
    if (!order.ok) return order.status;

    for (size_t i : order.value) {
        Status status = run_one(scripts[i], chroot, scripts[i].in_chroot.value_or(in_chroot));
        if (!status.ok) return status;
    }
    return ok_status();
}

Status ScriptRunner::run_one(const Script& script, const std::string& chroot, bool in_chroot) {
    auto body = load_script_body(script);
    if (!body.ok) return body.status;

    std::string name = "script-" + script_id(script);
    std::string dir = in_chroot ? join_path(chroot, "tmp") : ctx_.workspace.root;
    std::string path = join_path(dir, name);

    Status dir_ok = ensure_directory(dir);
    if (!dir_ok.ok) return dir_ok;

    Status written = atomic_write_file(path, body.value, 0755);
    if (!written.ok) return written;

    spdlog::info("Running script {}{}", script_label(script), in_chroot ? " (in chroot)" : "");

    Status status;
    if (in_chroot) {
        status = with_chroot(ctx_, chroot, [&]() {
            return ctx_.runner.run(Command{"unshare", unshare_args(chroot, "/tmp/" + name)});
        });
    } else {
        Command cmd{path, {}};
        cmd.env.emplace_back("CHROOT", chroot);
        status = ctx_.runner.run(cmd);
    }

    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) spdlog::warn("Failed to remove {}: {}", path, ec.message());

    if (!status.ok) {
        if (status.kind == ErrorKind::ExternalFailure) {
            status.kind = ErrorKind::ScriptFailure;
            status.error = "script " + script_label(script) + " failed: " + status.error;
        }
        return status;
    }
    return ok_status();
}

} // namespace katsu
