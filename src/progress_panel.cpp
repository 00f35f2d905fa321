#include "batchfetch/progress_panel.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iterator>
#include <ostream>
#include <utility>

#include <fmt/format.h>

namespace batchfetch {

ConsolePanel::ConsolePanel(std::ostream& out, bool interactive)
    : out_(out),
      interactive_(interactive) {
    if (interactive_) {
        renderer_ = std::thread([this]() { renderLoop(); });
    }
}

ConsolePanel::~ConsolePanel() {
    stop();
}

void ConsolePanel::onStart(const Progress& progress) {
    std::lock_guard<std::mutex> lock(mutex_);
    active_[progress.filename] = progress;
    dirty_ = true;
}

void ConsolePanel::onUpdate(const Progress& progress) {
    std::lock_guard<std::mutex> lock(mutex_);
    active_[progress.filename] = progress;
    dirty_ = true;
}

void ConsolePanel::onFinish(const Progress& progress) {
    std::lock_guard<std::mutex> lock(mutex_);
    active_.erase(progress.filename);

    //结束的任务固定输出在面板上方
    clearPanel();
    out_ << formatTaskLine(progress) << '\n';
    if (interactive_ && !stopping_) {
        redrawPanel();
    }
    out_ << std::flush;
}

void ConsolePanel::printLine(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    clearPanel();
    out_ << line;
    if (line.empty() || line.back() != '\n') {
        out_ << '\n';
    }
    if (interactive_ && !stopping_) {
        redrawPanel();
    }
    out_ << std::flush;
}

void ConsolePanel::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
    }
    wake_.notify_all();

    if (renderer_.joinable()) {
        renderer_.join();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    clearPanel();
    out_ << std::flush;
}

void ConsolePanel::renderLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        wake_.wait_for(lock, std::chrono::milliseconds(200), [this]() { return stopping_; });
        if (stopping_) {
            break;
        }
        if (dirty_) {
            clearPanel();
            redrawPanel();
            out_ << std::flush;
            dirty_ = false;
        }
    }
}

std::string ConsolePanel::buildPanel(const std::map<std::string, Progress>& active) {
    if (active.empty()) {
        return {};
    }

    std::uint64_t total_all = 0;
    std::uint64_t downloaded_all = 0;
    bool all_sized = true;

    const std::string rule(50, '-');
    std::string panel = fmt::format("{}\n{} transfer(s) in progress\n{}\n", rule, active.size(), rule);
    for (const auto& entry : active) {
        const auto& progress = entry.second;
        panel += formatTaskLine(progress);
        panel.push_back('\n');

        all_sized = all_sized && progress.total_bytes > 0;
        total_all += progress.total_bytes;
        downloaded_all += progress.downloaded_bytes;
    }

    //有任务未知大小时不显示百分比
    if (all_sized) {
        const double ratio = std::min(1.0, static_cast<double>(downloaded_all) /
                                               static_cast<double>(total_all));
        panel += fmt::format("{}\nOverall: {:>3}% of {}\n", rule, static_cast<int>(ratio * 100.0),
                             formatSize(total_all));
    } else {
        panel += fmt::format("{}\nOverall: {} received\n", rule, formatSize(downloaded_all));
    }
    return panel;
}

std::string ConsolePanel::formatTaskLine(const Progress& progress) {
    std::string line;
    line.reserve(256);

    std::string display_name = std::filesystem::path{progress.filename}.filename().string();
    if (display_name.size() > 28) {
        display_name = display_name.substr(0, 28);
    }
    if (display_name.empty()) {
        display_name = "(unnamed)";
    }

    if (progress.total_bytes > 0) {
        const double ratio = std::min(1.0, static_cast<double>(progress.downloaded_bytes) /
                                               static_cast<double>(progress.total_bytes));
        const int percent = static_cast<int>(ratio * 100.0);
        constexpr int bar_width = 30;
        const int bar_pos = static_cast<int>(ratio * bar_width);

        std::string bar;
        bar.reserve(static_cast<std::size_t>(bar_width) * 3);
        for (int i = 0; i < bar_width; ++i) {
            bar += (i < bar_pos) ? u8"█" : u8"░";
        }

        line += fmt::format("{:<28} [{}] {:>3}% ({}/{})",
                            display_name,
                            bar,
                            percent,
                            formatSize(progress.downloaded_bytes),
                            formatSize(progress.total_bytes));
    } else if (progress.downloaded_bytes > 0) {
        line += fmt::format("{:<28} [{}]", display_name, formatSize(progress.downloaded_bytes));
    } else {
        line += fmt::format("{:<28} [Connecting...]", display_name);
    }

    if (progress.has_error) {
        line += fmt::format("  ❌ {}", progress.error_message);
    } else if (!progress.is_running) {
        line.append("  ✅ Done");
    }

    return line;
}

std::string ConsolePanel::formatSize(std::uint64_t bytes) {
    static constexpr const char* units[] = {"KB", "MB", "GB", "TB"};
    if (bytes < 1024) {
        return fmt::format("{} B", bytes);
    }

    double value = static_cast<double>(bytes) / 1024.0;
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < std::size(units)) {
        value /= 1024.0;
        ++unit;
    }
    return fmt::format("{:.1f} {}", value, units[unit]);
}

void ConsolePanel::clearPanel() {
    if (previous_lines_ > 0) {
        out_ << "\033[" << previous_lines_ << "F\033[J";
        previous_lines_ = 0;
    }
}

void ConsolePanel::redrawPanel() {
    const auto panel = buildPanel(active_);
    out_ << panel;
    previous_lines_ = static_cast<std::size_t>(std::count(panel.begin(), panel.end(), '\n'));
}

PanelLogSink::PanelLogSink(std::shared_ptr<ConsolePanel> panel)
    : panel_(std::move(panel)) {}

void PanelLogSink::sink_it_(const spdlog::details::log_msg& msg) {
    spdlog::memory_buf_t formatted;
    formatter_->format(msg, formatted);
    panel_->printLine(fmt::to_string(formatted));
}

} // namespace batchfetch
