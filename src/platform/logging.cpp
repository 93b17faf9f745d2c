#include "katsu/log.hpp"
#include "katsu/platform.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace katsu {

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name) {
    std::string lower = trim(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return spdlog::level::trace;
    if (lower == "debug") return spdlog::level::debug;
    if (lower == "info") return spdlog::level::info;
    if (lower == "warn" || lower == "warning") return spdlog::level::warn;
    if (lower == "error") return spdlog::level::err;
    if (lower == "off") return spdlog::level::off;
    return std::nullopt;
}

void init_logging(bool verbose) {
    spdlog::drop("katsu");
    auto logger = spdlog::stderr_color_mt("katsu");
    logger->set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_default_logger(logger);

    spdlog::level::level_enum level = spdlog::level::info;
    std::string unknown;

    const char* env = std::getenv("KATSU_LOG");
    if (env && *env) {
        if (auto parsed = parse_log_level(env)) {
            level = *parsed;
        } else {
            unknown = env;
        }
    }
    if (verbose) level = spdlog::level::debug;

    spdlog::set_level(level);

    if (!unknown.empty()) {
        spdlog::warn("Unknown KATSU_LOG level '{}', using info", unknown);
    }
}

} // namespace katsu
