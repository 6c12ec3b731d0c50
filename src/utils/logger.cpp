#include "utils/logger.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <vector>

namespace chronodb {
namespace utils {

std::shared_ptr<spdlog::logger> Logger::logger_;

spdlog::level::level_enum Logger::toSpdlog(Level level) {
    switch (level) {
        case Level::TRACE: return spdlog::level::trace;
        case Level::DEBUG: return spdlog::level::debug;
        case Level::INFO: return spdlog::level::info;
        case Level::WARN: return spdlog::level::warn;
        case Level::ERROR: return spdlog::level::err;
        case Level::CRITICAL: return spdlog::level::critical;
    }
    return spdlog::level::info;
}

void Logger::init(const Options& options) {
    std::vector<spdlog::sink_ptr> sinks;
    if (options.console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }
    if (!options.file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.file, false));
        } catch (const spdlog::spdlog_ex& ex) {
            // Keep console logging when the file cannot be opened
            std::cerr << "Cannot open log file " << options.file << ": " << ex.what() << std::endl;
        }
    }

    auto logger = std::make_shared<spdlog::logger>("chronodb", sinks.begin(), sinks.end());
    logger->set_level(toSpdlog(options.level));
    logger->set_pattern(options.pattern);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
    logger_ = std::move(logger);

    logger_->info("Logger initialized (level={}, file={})", levelToString(options.level),
                  options.file.empty() ? "-" : options.file);
}

void Logger::reconfigure(const Options& options) {
    if (logger_) logger_->flush();
    init(options);
}

void Logger::shutdown() {
    if (!logger_) return;
    logger_->flush();
    logger_.reset();
    spdlog::shutdown();
}

std::optional<Logger::Level> Logger::parseLevel(std::string_view name) {
    std::string s(name);
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "trace") return Level::TRACE;
    if (s == "debug") return Level::DEBUG;
    if (s == "info") return Level::INFO;
    if (s == "warn" || s == "warning") return Level::WARN;
    if (s == "error" || s == "err") return Level::ERROR;
    if (s == "critical") return Level::CRITICAL;
    return std::nullopt;
}

const char* Logger::levelToString(Level level) {
    switch (level) {
        case Level::TRACE: return "trace";
        case Level::DEBUG: return "debug";
        case Level::INFO: return "info";
        case Level::WARN: return "warn";
        case Level::ERROR: return "error";
        case Level::CRITICAL: return "critical";
    }
    return "info";
}

} // namespace utils
} // namespace chronodb
