#pragma once

#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <memory>
#include <string>

namespace Scribe {

class Logger {
public:
    enum class Level {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Warn = 3,
        Error = 4,
        Critical = 5
    };

    static Logger& instance();

    // Replaces the console-only default logger with console + rotating file output.
    void initialize(const std::string& logFilePath = "scribe.log",
                    Level level = Level::Info);

    void setLevel(Level level);

    template<typename... Args>
    void trace(fmt::format_string<Args...> format, Args&&... args) {
        current()->trace(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(fmt::format_string<Args...> format, Args&&... args) {
        current()->debug(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(fmt::format_string<Args...> format, Args&&... args) {
        current()->info(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(fmt::format_string<Args...> format, Args&&... args) {
        current()->warn(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(fmt::format_string<Args...> format, Args&&... args) {
        current()->error(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void critical(fmt::format_string<Args...> format, Args&&... args) {
        current()->critical(format, std::forward<Args>(args)...);
    }

    // Plain message at a runtime-selected level, used by the engine log bridge.
    void log(Level level, const std::string& message);

private:
    Logger();
    std::shared_ptr<spdlog::logger> current() const;

    std::shared_ptr<spdlog::logger> logger_;
};

#define SCRIBE_TRACE(...) Scribe::Logger::instance().trace(__VA_ARGS__)
#define SCRIBE_DEBUG(...) Scribe::Logger::instance().debug(__VA_ARGS__)
#define SCRIBE_INFO(...) Scribe::Logger::instance().info(__VA_ARGS__)
#define SCRIBE_WARN(...) Scribe::Logger::instance().warn(__VA_ARGS__)
#define SCRIBE_ERROR(...) Scribe::Logger::instance().error(__VA_ARGS__)
#define SCRIBE_CRITICAL(...) Scribe::Logger::instance().critical(__VA_ARGS__)

} // namespace Scribe
