#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/logger.h>

namespace geo_sentinel {

inline constexpr std::string_view k_console_pattern{"[%l] %v"};
inline constexpr std::string_view k_file_pattern{R"({"ts":"%Y-%m-%dT%H:%M:%S.%fZ","level":"%l","thread":%t,"msg":%v})"};

std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory);

std::shared_ptr<spdlog::logger> get_logger();

/** @brief Apply an spdlog level name; unknown names fall back to info and return false. */
bool set_log_level(const std::string& str_level);

/** @brief Push buffered records to the sinks, e.g. before shutdown. */
void flush_logger();

}  // namespace geo_sentinel
