#include "batchfetch/dispatcher.hpp"
#include "batchfetch/logging.hpp"

#include <algorithm>
#include <exception>
#include <iterator>
#include <set>
#include <system_error>
#include <thread>
#include <utility>

namespace batchfetch {

WorkQueue::WorkQueue(std::vector<DownloadTask> tasks)
    : pending_(std::make_move_iterator(tasks.begin()), std::make_move_iterator(tasks.end())) {}

std::optional<DownloadTask> WorkQueue::claim() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pending_.empty()) {
        return std::nullopt;
    }
    DownloadTask task = std::move(pending_.front());
    pending_.pop_front();
    return task;
}

void WorkQueue::markDone() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++completed_;
}

std::size_t WorkQueue::completed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return completed_;
}

void FailureSet::add(std::string url) {
    std::lock_guard<std::mutex> lock(mutex_);
    urls_.push_back(std::move(url));
}

std::vector<std::string> FailureSet::take() {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::exchange(urls_, {});
}

std::size_t workerCountFor(int configured, std::size_t task_count) {
    if (task_count == 0) {
        return 0;
    }
    const auto wanted = static_cast<std::size_t>(std::max(1, configured));
    return std::min(wanted, task_count);
}

Dispatcher::Dispatcher(Transfer& transfer, DispatchOptions options)
    : transfer_(transfer),
      options_(std::move(options)) {}

RoundReport Dispatcher::dispatch(const std::vector<std::string>& urls) {
    std::vector<DownloadTask> tasks;
    tasks.reserve(urls.size());
    std::set<std::string> seen;
    for (const auto& url : urls) {
        if (!seen.insert(url).second) {
            BATCHFETCH_WARN("Skipping duplicate URL {}", url);
            continue;
        }
        tasks.push_back(makeDownloadTask(url, options_.save_dir));
    }

    RoundReport report;
    report.workers = workerCountFor(options_.concurrency, tasks.size());
    if (report.workers == 0) {
        return report;
    }

    //所有任务入队后再启动工作线程
    WorkQueue queue(std::move(tasks));
    FailureSet failures;

    std::mutex error_mutex;
    std::exception_ptr worker_error;
    auto work = [this, &queue, &failures, &error_mutex, &worker_error]() {
        try {
            workerLoop(queue, failures);
        } catch (...) {
            // 线程内的异常不能直接抛出, 等所有线程结束后再重新抛出
            std::lock_guard<std::mutex> lock(error_mutex);
            if (!worker_error) {
                worker_error = std::current_exception();
            }
        }
    };

    BATCHFETCH_INFO("Using {} worker thread(s) for {} file(s)", report.workers, seen.size());

    std::vector<std::thread> workers;
    workers.reserve(report.workers);
    for (std::size_t i = 0; i < report.workers; ++i) {
        try {
            workers.emplace_back(work);
        } catch (const std::system_error& ex) {
            BATCHFETCH_WARN("Could only start {} of {} workers: {}", workers.size(), report.workers,
                            ex.what());
            break;
        }
    }
    if (workers.empty()) {
        report.workers = 1;
        work();
    } else {
        report.workers = workers.size();
    }

    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    if (worker_error) {
        std::rethrow_exception(worker_error);
    }

    report.failed = failures.take();
    report.completed = queue.completed();
    return report;
}

void Dispatcher::workerLoop(WorkQueue& queue, FailureSet& failures) {
    while (auto task = queue.claim()) {
        if (!runGuarded(*task)) {
            failures.add(task->url);
        }
        queue.markDone();
    }
}

bool Dispatcher::runGuarded(const DownloadTask& task) {
    try {
        return transfer_.run(task);
    } catch (const std::exception& ex) {
        BATCHFETCH_ERROR("Error downloading {}: {}", task.url, ex.what());
        return false;
    }
}

} // namespace batchfetch
