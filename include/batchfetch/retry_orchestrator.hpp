#pragma once

#include "dispatcher.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace batchfetch {

struct RetryPolicy {
    int max_rounds{3};
    std::chrono::milliseconds cooldown{std::chrono::seconds(2)};
};

enum class RoundState {
    Initial,
    Retry,
    Done
};

// Runs the first pass and then up to `max_rounds` retry rounds over the
// previous round's failures, sleeping `cooldown` before each retry.
class RetryOrchestrator {
public:
    using SleepFn = std::function<void(std::chrono::milliseconds)>;

    RetryOrchestrator(Dispatcher& dispatcher, RetryPolicy policy, SleepFn sleep = {});

    // Never throws. Returns the URLs still failing after the last round.
    [[nodiscard]] std::vector<std::string> run(const std::vector<std::string>& urls);

    [[nodiscard]] int roundsRun() const { return rounds_run_; }
    [[nodiscard]] RoundState state() const { return state_; }

private:
    void cooldown();
    [[nodiscard]] RoundState next(const std::vector<std::string>& failed) const;
    [[nodiscard]] std::vector<std::string> runRound(const std::vector<std::string>& urls);

    Dispatcher& dispatcher_;
    RetryPolicy policy_;
    SleepFn sleep_;

    RoundState state_{RoundState::Initial};
    int retry_count_{0};
    int rounds_run_{0};
};

} // namespace batchfetch
