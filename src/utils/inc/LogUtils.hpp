#pragma once
#include <spdlog/fmt/fmt.h>
#include <spdlog/logger.h>
#include <spdlog/fmt/ostr.h>
#include <iostream>
#include <string>
#include <memory>

namespace LogUtils {

enum class Level {
    Debug,
    Info,
    Warn,
    Error,
    Fatal
};

struct Options {
    Level level = Level::Info;
    std::string log_file = "log/sqlcmdgen.log";
    size_t max_file_size = 1024 * 1024 * 5;
    size_t max_files = 3;

    // Route console output to stderr so stdout can carry the generated script
    bool console_to_stderr = false;
};

// Initialize the log system
void init(const Options& options);
void init(Level level = Level::Info,
          const std::string& log_file = "log/sqlcmdgen.log",
          size_t max_file_size = 1024 * 1024 * 5,
          size_t max_files = 3);

void shutdown();
void set_level(Level level);

// Accepts debug, info, warn, error, fatal (case-insensitive)
Level parse_level(const std::string& name);

// Logger instance
extern std::shared_ptr<spdlog::logger> logger;

// String version
void debug(const std::string& msg);
void info(const std::string& msg);
void warn(const std::string& msg);
void error(const std::string& msg);
void fatal(const std::string& msg);

// Variadic template version (fmt-style)
template <typename... Args>
inline void debug(fmt::format_string<Args...> fmt, Args&&... args) {
    if (logger) {
        logger->debug(fmt, std::forward<Args>(args)...);
    } else {
        std::cerr << "[DEBUG] " << fmt::format(fmt, std::forward<Args>(args)...) << std::endl;
    }
}

template <typename... Args>
inline void info(fmt::format_string<Args...> fmt, Args&&... args) {
    if (logger) {
        logger->info(fmt, std::forward<Args>(args)...);
    } else {
        std::cerr << "[INFO] " << fmt::format(fmt, std::forward<Args>(args)...) << std::endl;
    }
}

template <typename... Args>
inline void warn(fmt::format_string<Args...> fmt, Args&&... args) {
    if (logger) {
        logger->warn(fmt, std::forward<Args>(args)...);
    } else {
        std::cerr << "[WARN] " << fmt::format(fmt, std::forward<Args>(args)...) << std::endl;
    }
}

template <typename... Args>
inline void error(fmt::format_string<Args...> fmt, Args&&... args) {
    if (logger) {
        logger->error(fmt, std::forward<Args>(args)...);
    } else {
        std::cerr << "[ERROR] " << fmt::format(fmt, std::forward<Args>(args)...) << std::endl;
    }
}

template <typename... Args>
inline void fatal(fmt::format_string<Args...> fmt, Args&&... args) {
    if (logger) {
        logger->critical(fmt, std::forward<Args>(args)...);
    } else {
        std::cerr << "[FATAL] " << fmt::format(fmt, std::forward<Args>(args)...) << std::endl;
    }
}

class LoggerGuard {
public:
    explicit LoggerGuard(const Options& options) {
        LogUtils::init(options);
    }

    ~LoggerGuard() {
        LogUtils::shutdown();
    }

    LoggerGuard(const LoggerGuard&) = delete;
    LoggerGuard& operator=(const LoggerGuard&) = delete;

    void set_level(Level level) {
        LogUtils::set_level(level);
    }
};

}
