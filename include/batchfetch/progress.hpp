#pragma once

#include <cstdint>
#include <memory>
#include <string>

namespace batchfetch {

struct Progress {
    std::string url;
    std::string filename;
    std::uint64_t total_bytes{0};
    std::uint64_t downloaded_bytes{0};
    bool is_running{false};
    bool has_error{false};
    std::string error_message;
};

// Observer for transfer byte counts. Called from worker threads, so
// implementations must be thread-safe.
class ProgressSink {
public:
    virtual ~ProgressSink() = default;

    virtual void onStart(const Progress& progress) = 0;
    virtual void onUpdate(const Progress& progress) = 0;
    virtual void onFinish(const Progress& progress) = 0;
};

using ProgressSinkPtr = std::shared_ptr<ProgressSink>;

// Scoped progress indicator for one transfer, owned by the worker that
// runs it. onStart is reported on construction and onFinish on
// destruction, whatever path the transfer leaves through.
class ProgressScope {
public:
    ProgressScope(ProgressSink* sink, std::string url, std::string filename,
                  std::uint64_t initial_bytes);
    ~ProgressScope();

    ProgressScope(const ProgressScope&) = delete;
    ProgressScope& operator=(const ProgressScope&) = delete;

    void setTotal(std::uint64_t total_bytes);
    void advance(std::uint64_t bytes);
    // Drops the bytes counted so far and restarts from `initial_bytes`.
    void restart(std::uint64_t initial_bytes);
    void fail(std::string message);
    void complete();

    [[nodiscard]] Progress snapshot() const;

private:
    ProgressSink* sink_;
    Progress progress_;
};

} // namespace batchfetch
