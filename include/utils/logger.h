#pragma once

// Windows headers define ERROR as a macro
#ifdef ERROR
#undef ERROR
#endif

#include <spdlog/spdlog.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace chronodb {
namespace utils {

/**
 * Process-wide spdlog facade. Components log through the CHRONODB_* macros;
 * before init() (e.g. in unit tests) every call is a no-op.
 */
class Logger {
public:
    enum class Level { TRACE, DEBUG, INFO, WARN, ERROR, CRITICAL };

    struct Options {
        Level level = Level::INFO;
        std::string file;   // empty: console only
        bool console = true;
        std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [thread %t] %v";
    };

    static void init(const Options& options);
    static void init() { init(Options{}); }

    /// Rebuild the sinks, e.g. once the config file named a log file
    static void reconfigure(const Options& options);

    static void shutdown();

    static std::optional<Level> parseLevel(std::string_view name);
    static const char* levelToString(Level level);

    template<typename... Args>
    static void log(Level level, std::string_view fmt, Args&&... args) {
        if (!logger_) return;
        logger_->log(toSpdlog(level), fmt::runtime(fmt), std::forward<Args>(args)...);
    }

private:
    static spdlog::level::level_enum toSpdlog(Level level);

    static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace utils
} // namespace chronodb

#define CHRONODB_TRACE(...) ::chronodb::utils::Logger::log(::chronodb::utils::Logger::Level::TRACE, __VA_ARGS__)
#define CHRONODB_DEBUG(...) ::chronodb::utils::Logger::log(::chronodb::utils::Logger::Level::DEBUG, __VA_ARGS__)
#define CHRONODB_INFO(...) ::chronodb::utils::Logger::log(::chronodb::utils::Logger::Level::INFO, __VA_ARGS__)
#define CHRONODB_WARN(...) ::chronodb::utils::Logger::log(::chronodb::utils::Logger::Level::WARN, __VA_ARGS__)
#define CHRONODB_ERROR(...) ::chronodb::utils::Logger::log(::chronodb::utils::Logger::Level::ERROR, __VA_ARGS__)
#define CHRONODB_CRITICAL(...) ::chronodb::utils::Logger::log(::chronodb::utils::Logger::Level::CRITICAL, __VA_ARGS__)
