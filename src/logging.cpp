#include "batchfetch/logging.hpp"

#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace batchfetch {

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(Level level, const std::string& log_file, spdlog::sink_ptr console) {
    try {
        if (!console) {
            console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        }
        console->set_pattern("[%H:%M:%S] [%^%l%$] %v");

        std::vector<spdlog::sink_ptr> sinks{console};
        if (!log_file.empty()) {
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
            sinks.push_back(std::move(file_sink));
        }

        logger_ = std::make_shared<spdlog::logger>("batchfetch", sinks.begin(), sinks.end());
        setLevel(level);
    } catch (const spdlog::spdlog_ex& ex) {
        // Fallback to console only
        logger_ = std::make_shared<spdlog::logger>(
            "batchfetch", std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        setLevel(level);
        logger_->error("Logger initialization failed: {}", ex.what());
    }
}

void Logger::setLevel(Level level) {
    if (logger_) {
        logger_->set_level(static_cast<spdlog::level::level_enum>(level));
        logger_->flush_on(spdlog::level::warn);
    }
}

std::shared_ptr<spdlog::logger> Logger::get() {
    if (logger_) {
        return logger_;
    }
    return spdlog::default_logger();
}

} // namespace batchfetch
