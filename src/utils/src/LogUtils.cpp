#include "LogUtils.hpp"
#include "StringUtils.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/async.h>
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <vector>
#include <filesystem>

namespace LogUtils {

std::shared_ptr<spdlog::logger> logger;

spdlog::level::level_enum to_spdlog_level(Level level) {
    switch (level) {
        case Level::Debug: return spdlog::level::debug;
        case Level::Info:  return spdlog::level::info;
        case Level::Warn:  return spdlog::level::warn;
        case Level::Error: return spdlog::level::err;
        case Level::Fatal: return spdlog::level::critical;
        default:           return spdlog::level::info;
    }
}

class LevelFullNameFormatter : public spdlog::custom_flag_formatter {
public:
    void format(const spdlog::details::log_msg& msg, const std::tm&, spdlog::memory_buf_t& dest) override {
        static const char* level_names[] = {
            "TRACE", "DEBUG", "INFO ", "WARN ", "ERROR", "FATAL", "OFF  "
        };
        auto lvl = static_cast<size_t>(msg.level);
        const char* name = lvl < sizeof(level_names) / sizeof(level_names[0]) ? level_names[lvl] : "INFO ";
        dest.append(name, name + std::strlen(name));
    }

    std::unique_ptr<spdlog::custom_flag_formatter> clone() const override {
        return std::make_unique<LevelFullNameFormatter>();
    }
};

void init(const Options& options) {
    std::filesystem::path log_path(options.log_file);
    std::filesystem::path parent_dir = log_path.parent_path();

    if (!parent_dir.empty() && !std::filesystem::exists(parent_dir)) {
        std::filesystem::create_directories(parent_dir);
    }

    spdlog::init_thread_pool(8192, 1);

    spdlog::sink_ptr console_sink;
    if (options.console_to_stderr) {
        console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    } else {
        console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    }
    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        options.log_file, options.max_file_size, options.max_files);

    std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
    logger = std::make_shared<spdlog::async_logger>(
        "sqlcmdgen_logger", sinks.begin(), sinks.end(),
        spdlog::thread_pool(), spdlog::async_overflow_policy::block);

    auto formatter = std::make_unique<spdlog::pattern_formatter>(
        "%Y-%m-%d %H:%M:%S.%f %t %X %v"
    );
    formatter->add_flag<LevelFullNameFormatter>('X');

    logger->set_formatter(std::move(formatter));
    logger->set_level(to_spdlog_level(options.level));
    logger->flush_on(spdlog::level::info);
    spdlog::flush_every(std::chrono::seconds(1));
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);
}

void init(Level level, const std::string& log_file, size_t max_file_size, size_t max_files) {
    Options options;
    options.level = level;
    options.log_file = log_file;
    options.max_file_size = max_file_size;
    options.max_files = max_files;
    init(options);
}

void shutdown() {
    if (logger) {
        logger->flush();
        logger.reset();
    }
    spdlog::shutdown();
}

void set_level(Level level) {
    if (logger) logger->set_level(to_spdlog_level(level));
}

Level parse_level(const std::string& name) {
    const std::string lower = StringUtils::to_lower(name);
    if (lower == "debug") return Level::Debug;
    if (lower == "info")  return Level::Info;
    if (lower == "warn" || lower == "warning") return Level::Warn;
    if (lower == "error") return Level::Error;
    if (lower == "fatal") return Level::Fatal;
    throw std::invalid_argument("Invalid log level: " + name);
}

void debug(const std::string& msg) {
    if (logger) {
        logger->debug(msg);
    } else {
        std::cerr << "[DEBUG] " << msg << std::endl;
    }
}

void info(const std::string& msg) {
    if (logger) {
        logger->info(msg);
    } else {
        std::cerr << "[INFO] " << msg << std::endl;
    }
}

void warn(const std::string& msg) {
    if (logger) {
        logger->warn(msg);
    } else {
        std::cerr << "[WARN] " << msg << std::endl;
    }
}

void error(const std::string& msg) {
    if (logger) {
        logger->error(msg);
    } else {
        std::cerr << "[ERROR] " << msg << std::endl;
    }
}

void fatal(const std::string& msg) {
    if (logger) {
        logger->critical(msg);
    } else {
        std::cerr << "[FATAL] " << msg << std::endl;
    }
}

}
