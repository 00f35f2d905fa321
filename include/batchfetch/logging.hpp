#pragma once

#include <memory>
#include <string>
#include <utility>

#include <fmt/core.h>
#include <spdlog/sinks/sink.h>
#include <spdlog/spdlog.h>

namespace batchfetch {

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

    // `console` replaces the default stderr sink; `log_file` adds a file
    // sink when not empty.
    void initialize(Level level = Level::Info,
                    const std::string& log_file = {},
                    spdlog::sink_ptr console = nullptr);

    void setLevel(Level level);

    template<typename... Args>
    void debug(fmt::format_string<Args...> format, Args&&... args) {
        get()->debug(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(fmt::format_string<Args...> format, Args&&... args) {
        get()->info(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(fmt::format_string<Args...> format, Args&&... args) {
        get()->warn(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(fmt::format_string<Args...> format, Args&&... args) {
        get()->error(format, std::forward<Args>(args)...);
    }

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> get();

    std::shared_ptr<spdlog::logger> logger_;
};

#define BATCHFETCH_DEBUG(...) ::batchfetch::Logger::instance().debug(__VA_ARGS__)
#define BATCHFETCH_INFO(...) ::batchfetch::Logger::instance().info(__VA_ARGS__)
#define BATCHFETCH_WARN(...) ::batchfetch::Logger::instance().warn(__VA_ARGS__)
#define BATCHFETCH_ERROR(...) ::batchfetch::Logger::instance().error(__VA_ARGS__)

} // namespace batchfetch
