#include "geo_sentinel/logging.hpp"

#include <filesystem>
#include <mutex>
#include <stdexcept>
#include <string_view>
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace geo_sentinel {

namespace {
std::once_flag logger_once_flag;
std::shared_ptr<spdlog::logger> shared_logger;
constexpr std::string_view k_logger_name{"geo_sentinel"};
constexpr std::string_view k_log_file_name{"geo_sentinel.log"};
constexpr std::size_t k_max_file_size_bytes{10 * 1024 * 1024};
constexpr std::size_t k_max_files{5};

spdlog::sink_ptr make_file_sink(const std::string& log_directory) {
    const std::filesystem::path path_log_dir{log_directory};
    std::error_code error_directory;
    std::filesystem::create_directories(path_log_dir, error_directory);
    if (error_directory) {
        throw std::runtime_error("Unable to create log directory at " + path_log_dir.string() + ": " + error_directory.message());
    }

    const std::filesystem::path path_log_file = path_log_dir / k_log_file_name;
    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(path_log_file.string(), k_max_file_size_bytes, k_max_files);
    file_sink->set_formatter(std::make_unique<spdlog::pattern_formatter>(std::string{k_file_pattern}, spdlog::pattern_time_type::utc));
    return file_sink;
}
}  // namespace

std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory) {
    std::call_once(
        logger_once_flag,
        [&log_directory]() {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_pattern(std::string{k_console_pattern});

            spdlog::sinks_init_list sinks{console_sink, make_file_sink(log_directory)};
            shared_logger = std::make_shared<spdlog::logger>(std::string{k_logger_name}, sinks);
            shared_logger->set_level(spdlog::level::info);
            shared_logger->flush_on(spdlog::level::warn);
            spdlog::register_logger(shared_logger);
        }
    );
    return shared_logger;
}

std::shared_ptr<spdlog::logger> get_logger() {
    if (!shared_logger) {
        throw std::runtime_error("Logger not initialized");
    }
    return shared_logger;
}

bool set_log_level(const std::string& str_level) {
    if (!shared_logger) {
        return false;
    }
    // from_str maps unknown names to off instead of throwing.
    const auto level = spdlog::level::from_str(str_level);
    if (level == spdlog::level::off && str_level != "off") {
        shared_logger->warn("Unknown log level {}; defaulting to info", str_level);
        shared_logger->set_level(spdlog::level::info);
        return false;
    }
    shared_logger->set_level(level);
    return true;
}

void flush_logger() {
    if (shared_logger) {
        shared_logger->flush();
    }
}

}  // namespace geo_sentinel
