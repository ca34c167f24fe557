#include "logger.h"

#include <cstdlib>
#include <string>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/dist_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace chunkslice::log {

namespace {

constexpr auto LOGGER_NAME = "chunkslice";
constexpr auto LEVEL_ENV = "CHUNKSLICE_LOG_LEVEL";

bool parse_level(std::string_view name, spdlog::level::level_enum& out) {
    if (name == "warning") {
        name = "warn";
    }
    const auto level = spdlog::level::from_str(std::string(name));
    // from_str maps unknown names to off
    if (level == spdlog::level::off && name != "off") {
        return false;
    }
    out = level;
    return true;
}

// The logger's only sink; the sinks behind it change under its own lock.
std::shared_ptr<spdlog::sinks::dist_sink_mt> fanout() {
    static auto instance = std::make_shared<spdlog::sinks::dist_sink_mt>(
        std::vector<spdlog::sink_ptr>{std::make_shared<spdlog::sinks::stderr_color_sink_mt>()});
    return instance;
}

std::shared_ptr<spdlog::logger> create_logger() {
    auto created = std::make_shared<spdlog::logger>(LOGGER_NAME, fanout());
    spdlog::register_logger(created);
    created->set_level(spdlog::level::warn);
    if (const char* env = std::getenv(LEVEL_ENV)) {
        auto level = spdlog::level::warn;
        if (parse_level(env, level)) {
            created->set_level(level);
        } else {
            created->warn("Ignoring unknown {} value '{}'.", LEVEL_ENV, env);
        }
    }
    return created;
}

} // namespace

std::shared_ptr<spdlog::logger> logger() {
    static auto instance = create_logger();
    return instance;
}

bool set_level(const std::string_view level) {
    auto parsed = spdlog::level::info;
    if (!parse_level(level, parsed)) {
        return false;
    }
    logger()->set_level(parsed);
    return true;
}

std::shared_ptr<spdlog::sinks::sink> add_log_file(const std::filesystem::path& path) {
    auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path.string());
    fanout()->add_sink(sink);
    return sink;
}

void remove_log_sink(const std::shared_ptr<spdlog::sinks::sink>& sink) {
    fanout()->remove_sink(sink);
}

} // namespace chunkslice::log
