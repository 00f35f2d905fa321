#pragma once

#include "download_task.hpp"
#include "transfer.hpp"

#include <cstddef>
#include <deque>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace batchfetch {

// Pending tasks of one round. Each task is handed out exactly once.
class WorkQueue {
public:
    explicit WorkQueue(std::vector<DownloadTask> tasks);

    [[nodiscard]] std::optional<DownloadTask> claim();
    void markDone();

    [[nodiscard]] std::size_t completed() const;

private:
    mutable std::mutex mutex_;
    std::deque<DownloadTask> pending_;
    std::size_t completed_{0};
};

// Append-only collection of failed URLs, written by every worker.
class FailureSet {
public:
    void add(std::string url);
    [[nodiscard]] std::vector<std::string> take();

private:
    std::mutex mutex_;
    std::vector<std::string> urls_;
};

struct RoundReport {
    std::vector<std::string> failed;
    std::size_t workers{0};
    std::size_t completed{0};
};

struct DispatchOptions {
    std::filesystem::path save_dir{"nuscenes"};
    int concurrency{3};
};

[[nodiscard]] std::size_t workerCountFor(int configured, std::size_t task_count);

class Dispatcher {
public:
    Dispatcher(Transfer& transfer, DispatchOptions options);

    // Runs one round over `urls` and blocks until every claimed task is done.
    // An error escaping a worker is rethrown here once all workers have joined.
    [[nodiscard]] RoundReport dispatch(const std::vector<std::string>& urls);

private:
    void workerLoop(WorkQueue& queue, FailureSet& failures);
    [[nodiscard]] bool runGuarded(const DownloadTask& task);

    Transfer& transfer_;
    DispatchOptions options_;
};

} // namespace batchfetch
