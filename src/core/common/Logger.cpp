#include "Logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <atomic>

namespace Scribe {

namespace {

constexpr std::size_t kMaxLogFileSize = 1024 * 1024 * 5;
constexpr std::size_t kMaxLogFiles = 3;

std::shared_ptr<spdlog::sinks::sink> makeConsoleSink() {
    auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    sink->set_pattern("[%H:%M:%S] [%^%l%$] [%t] %v");
    return sink;
}

} // namespace

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::Logger()
    : logger_(std::make_shared<spdlog::logger>("scribe", makeConsoleSink())) {
    logger_->set_level(spdlog::level::info);
}

std::shared_ptr<spdlog::logger> Logger::current() const {
    return std::atomic_load(&logger_);
}

void Logger::initialize(const std::string& logFilePath, Level level) {
    std::shared_ptr<spdlog::logger> replacement;
    try {
        auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logFilePath, kMaxLogFileSize, kMaxLogFiles);
        fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%f] [%l] [%t] %v");

        replacement = std::make_shared<spdlog::logger>(
            "scribe", spdlog::sinks_init_list{makeConsoleSink(), fileSink});
    } catch (const spdlog::spdlog_ex& ex) {
        replacement = std::make_shared<spdlog::logger>("scribe", makeConsoleSink());
        replacement->set_level(static_cast<spdlog::level::level_enum>(level));
        replacement->error("Logger: cannot open log file {}: {}", logFilePath, ex.what());
    }

    replacement->set_level(static_cast<spdlog::level::level_enum>(level));
    replacement->flush_on(spdlog::level::warn);
    std::atomic_store(&logger_, replacement);

    SCRIBE_INFO("Logger: writing to {}", logFilePath);
}

void Logger::setLevel(Level level) {
    current()->set_level(static_cast<spdlog::level::level_enum>(level));
}

void Logger::log(Level level, const std::string& message) {
    current()->log(static_cast<spdlog::level::level_enum>(level), message);
}

} // namespace Scribe
