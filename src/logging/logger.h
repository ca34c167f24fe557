#pragma once

#include <filesystem>
#include <memory>
#include <string_view>

#include <spdlog/logger.h>
#include <spdlog/sinks/sink.h>

namespace chunkslice::log {

/**
 * @brief The library logger, named "chunkslice", writing to stderr.
 *
 * Created on first use; its level comes from CHUNKSLICE_LOG_LEVEL (trace, debug, info,
 * warn, error, critical, off) and defaults to warn.
 */
std::shared_ptr<spdlog::logger> logger();

/** @brief Sets the level by name. Returns false and leaves the level alone for unknown names. */
bool set_level(std::string_view level);

/**
 * @brief Also writes log lines to `path`. Safe while other threads log.
 * @return The new sink, for remove_log_sink().
 */
std::shared_ptr<spdlog::sinks::sink> add_log_file(const std::filesystem::path& path);

/** @brief Detaches a sink returned by add_log_file(). Safe while other threads log. */
void remove_log_sink(const std::shared_ptr<spdlog::sinks::sink>& sink);

} // namespace chunkslice::log
