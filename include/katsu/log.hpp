#pragma once

#include <optional>
#include <string>

#include <spdlog/common.h>

namespace katsu {

// Map "trace" | "debug" | "info" | "warn" | "error" | "off" to a level
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name);

// Configure the default spdlog logger on stderr.
// Priority: verbose (debug) > KATSU_LOG > info.
void init_logging(bool verbose);

} // namespace katsu
