#include "batchfetch/progress.hpp"
#include "batchfetch/logging.hpp"

#include <exception>
#include <utility>

namespace batchfetch {

ProgressScope::ProgressScope(ProgressSink* sink, std::string url, std::string filename,
                             std::uint64_t initial_bytes)
    : sink_(sink) {
    progress_.url = std::move(url);
    progress_.filename = std::move(filename);
    progress_.downloaded_bytes = initial_bytes;
    progress_.is_running = true;

    if (sink_) {
        sink_->onStart(progress_);
    }
}

ProgressScope::~ProgressScope() {
    progress_.is_running = false;
    if (!sink_) {
        return;
    }
    try {
        sink_->onFinish(progress_);
    } catch (const std::exception& ex) {
        BATCHFETCH_WARN("Progress sink failed for {}: {}", progress_.filename, ex.what());
    }
}

void ProgressScope::setTotal(std::uint64_t total_bytes) {
    progress_.total_bytes = total_bytes;
    if (sink_) {
        sink_->onUpdate(progress_);
    }
}

void ProgressScope::advance(std::uint64_t bytes) {
    if (bytes == 0) {
        return;
    }
    progress_.downloaded_bytes += bytes;
    if (sink_) {
        sink_->onUpdate(progress_);
    }
}

void ProgressScope::restart(std::uint64_t initial_bytes) {
    progress_.downloaded_bytes = initial_bytes;
    if (sink_) {
        sink_->onUpdate(progress_);
    }
}

void ProgressScope::fail(std::string message) {
    progress_.has_error = true;
    if (progress_.error_message.empty()) {
        progress_.error_message = std::move(message);
    }
}

void ProgressScope::complete() {
    // 没有Content-Length时以实际下载量为准
    if (progress_.total_bytes == 0) {
        progress_.total_bytes = progress_.downloaded_bytes;
    }
}

Progress ProgressScope::snapshot() const {
    return progress_;
}

} // namespace batchfetch
