#pragma once

#include "progress.hpp"

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <spdlog/sinks/base_sink.h>

namespace batchfetch {

// Console renderer for all transfers of a run. On a terminal a panel of
// active transfers is redrawn in place; otherwise only finished
// transfers are printed.
class ConsolePanel final : public ProgressSink {
public:
    explicit ConsolePanel(std::ostream& out, bool interactive);
    ~ConsolePanel() override;

    ConsolePanel(const ConsolePanel&) = delete;
    ConsolePanel& operator=(const ConsolePanel&) = delete;

    void onStart(const Progress& progress) override;
    void onUpdate(const Progress& progress) override;
    void onFinish(const Progress& progress) override;

    // Prints a line above the panel without corrupting it.
    void printLine(const std::string& line);

    void stop();

    [[nodiscard]] bool interactive() const { return interactive_; }

    // Active transfers followed by an overall line; empty when nothing runs.
    static std::string buildPanel(const std::map<std::string, Progress>& active);
    static std::string formatTaskLine(const Progress& progress);
    static std::string formatSize(std::uint64_t bytes);

private:
    void renderLoop();
    void clearPanel();
    void redrawPanel();

    std::ostream& out_;
    const bool interactive_;

    mutable std::mutex mutex_;
    std::condition_variable wake_;
    std::map<std::string, Progress> active_;
    std::size_t previous_lines_{0};
    bool dirty_{false};
    bool stopping_{false};
    std::thread renderer_;
};

// spdlog sink that routes formatted records through ConsolePanel::printLine.
class PanelLogSink final : public spdlog::sinks::base_sink<std::mutex> {
public:
    explicit PanelLogSink(std::shared_ptr<ConsolePanel> panel);

protected:
    void sink_it_(const spdlog::details::log_msg& msg) override;
    void flush_() override {}

private:
    std::shared_ptr<ConsolePanel> panel_;
};

} // namespace batchfetch
