#include "Logging.hpp"
#include <memory>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

void initLogging(const std::filesystem::path& logFile, const std::string& level) {
    std::shared_ptr<spdlog::logger> logger;
    try {
        std::error_code ec;
        std::filesystem::create_directories(logFile.parent_path(), ec);
        auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile.string());
        logger = std::make_shared<spdlog::logger>("folder_player", sink);
    } catch (const spdlog::spdlog_ex& e) {
        logger = std::make_shared<spdlog::logger>("folder_player", std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        logger->warn("cannot open log file {}: {}", logFile.string(), e.what());
    }

    logger->set_level(spdlog::level::from_str(level));
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
}
