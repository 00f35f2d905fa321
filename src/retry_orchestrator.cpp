#include "batchfetch/retry_orchestrator.hpp"
#include "batchfetch/logging.hpp"

#include <exception>
#include <thread>
#include <utility>

namespace batchfetch {

RetryOrchestrator::RetryOrchestrator(Dispatcher& dispatcher, RetryPolicy policy, SleepFn sleep)
    : dispatcher_(dispatcher),
      policy_(policy),
      sleep_(std::move(sleep)) {
    if (!sleep_) {
        sleep_ = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
    }
}

std::vector<std::string> RetryOrchestrator::run(const std::vector<std::string>& urls) {
    state_ = RoundState::Initial;
    retry_count_ = 0;
    rounds_run_ = 0;

    std::vector<std::string> pending = urls;
    while (state_ != RoundState::Done) {
        if (state_ == RoundState::Retry) {
            ++retry_count_;
            cooldown();
            BATCHFETCH_INFO("Retry {}/{} for {} failed file(s)",
                            retry_count_, policy_.max_rounds, pending.size());
        }

        pending = runRound(pending);
        state_ = next(pending);
    }
    return pending;
}

void RetryOrchestrator::cooldown() {
    try {
        sleep_(policy_.cooldown);
    } catch (const std::exception& ex) {
        BATCHFETCH_WARN("Cooldown interrupted: {}", ex.what());
    }
}

RoundState RetryOrchestrator::next(const std::vector<std::string>& failed) const {
    if (failed.empty()) {
        return RoundState::Done;
    }
    if (retry_count_ >= policy_.max_rounds) {
        return RoundState::Done;
    }
    return RoundState::Retry;
}

std::vector<std::string> RetryOrchestrator::runRound(const std::vector<std::string>& urls) {
    ++rounds_run_;
    try {
        auto report = dispatcher_.dispatch(urls);
        BATCHFETCH_DEBUG("Round {} finished: {} completed, {} failed",
                         rounds_run_, report.completed, report.failed.size());
        return std::move(report.failed);
    } catch (const std::exception& ex) {
        // 整轮失败时保留本轮全部URL, 交给下一轮
        BATCHFETCH_ERROR("Round {} aborted: {}", rounds_run_, ex.what());
        return urls;
    } catch (...) {
        BATCHFETCH_ERROR("Round {} aborted by an unknown exception", rounds_run_);
        return urls;
    }
}

} // namespace batchfetch
