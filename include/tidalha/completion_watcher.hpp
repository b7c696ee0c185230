// filename: completion_watcher.hpp
// part of Tidal Harmonic Analysis Driver
// MIT License

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "tidalha/scheduler.hpp"

namespace tidalha {

struct PollClock {
    using Clock = std::chrono::steady_clock;

    virtual ~PollClock() = default;
    virtual Clock::time_point now() = 0;
    virtual void sleepFor(std::chrono::duration<double> interval) = 0;
};

class SteadyPollClock : public PollClock {
public:
    Clock::time_point now() override { return Clock::now(); }
    void sleepFor(std::chrono::duration<double> interval) override;
};

enum class TaskState { Pending, Done, TimedOut };

const char* toString(TaskState state);

struct WatchOptions {
    double pollIntervalSec{10.0};
    double maxWaitSec{0.0};  // zero waits forever
    bool quiet{false};
    // Polled between checks; returning true stops the wait with RunAbortedError.
    std::function<bool()> abortRequested;
};

/**
 * @brief Per-task completion state machine forming the barrier before assembly.
 *
 * Pending tasks move to Done once the watcher reports completion, or to TimedOut
 * when the wait budget runs out. Tasks that own no nodes start out Done.
 */
class CompletionWatcher {
public:
    CompletionWatcher(JobWatcher& watcher, PollClock& clock, WatchOptions options);

    void track(const std::vector<JobHandle>& handles);

    // One pass over the pending tasks. Returns true when every task is Done.
    bool pollOnce();

    /**
     * @brief Poll until every tracked task is Done.
     * @throws IncompleteTaskError when the deadline passes, RunAbortedError on abort.
     */
    void waitForAll(const std::vector<JobHandle>& handles);

    [[nodiscard]] TaskState state(std::size_t taskIndex) const;
    [[nodiscard]] std::size_t doneCount() const;
    [[nodiscard]] std::size_t pollCount() const { return polls_; }
    [[nodiscard]] std::vector<std::size_t> tasksInState(TaskState state) const;

private:
    struct Entry {
        JobHandle handle;
        TaskState state{TaskState::Pending};
    };

    JobWatcher& watcher_;
    PollClock& clock_;
    WatchOptions options_;
    std::vector<Entry> entries_;
    std::size_t polls_{0};
};

}  // namespace tidalha
