// filename: completion_watcher.cpp
// part of Tidal Harmonic Analysis Driver
// MIT License

#include "tidalha/completion_watcher.hpp"

#include "tidalha/errors.hpp"
#include "tidalha/types.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <utility>

namespace tidalha {

void SteadyPollClock::sleepFor(std::chrono::duration<double> interval) {
    std::this_thread::sleep_for(interval);
}

const char* toString(TaskState state) {
    switch (state) {
        case TaskState::Pending:
            return "pending";
        case TaskState::Done:
            return "done";
        case TaskState::TimedOut:
            return "timed out";
    }
    return "unknown";
}

CompletionWatcher::CompletionWatcher(JobWatcher& watcher, PollClock& clock, WatchOptions options)
    : watcher_(watcher), clock_(clock), options_(std::move(options)) {
    if (!(options_.pollIntervalSec > 0.0)) {
        throw std::invalid_argument("CompletionWatcher: poll interval must be positive");
    }
}

void CompletionWatcher::track(const std::vector<JobHandle>& handles) {
    entries_.clear();
    polls_ = 0;
    entries_.reserve(handles.size());
    for (const auto& handle : handles) {
        Entry entry{};
        entry.handle = handle;
        entry.state = handle.nodeCount == 0 ? TaskState::Done : TaskState::Pending;
        entries_.push_back(std::move(entry));
    }
}

bool CompletionWatcher::pollOnce() {
    ++polls_;
    bool allDone = true;
    for (auto& entry : entries_) {
        if (entry.state == TaskState::Pending && watcher_.isComplete(entry.handle)) {
            entry.state = TaskState::Done;
            if (!options_.quiet) {
                std::cout << "Task " << taskTag(entry.handle.taskIndex) << " done\n";
            }
        }
        if (entry.state != TaskState::Done) {
            allDone = false;
        }
    }
    return allDone;
}

void CompletionWatcher::waitForAll(const std::vector<JobHandle>& handles) {
    track(handles);

    const auto start = clock_.now();
    const std::chrono::duration<double> interval(options_.pollIntervalSec);
    std::size_t reportedDone = doneCount();

    while (true) {
        if (pollOnce()) {
            if (!options_.quiet) {
                std::cout << "All " << entries_.size() << " task(s) reported completion\n";
            }
            return;
        }

        const std::size_t done = doneCount();
        if (!options_.quiet && done != reportedDone) {
            std::cout << done << " of " << entries_.size() << " task(s) complete\n";
            reportedDone = done;
        }

        if (options_.abortRequested && options_.abortRequested()) {
            throw RunAbortedError("Run aborted while waiting for " +
                                  std::to_string(entries_.size() - done) + " task(s)");
        }

        const std::chrono::duration<double> waited = clock_.now() - start;
        if (options_.maxWaitSec > 0.0 && waited.count() >= options_.maxWaitSec) {
            std::vector<std::size_t> stuck;
            std::ostringstream msg;
            msg << "Tasks did not report completion within " << options_.maxWaitSec << " s:";
            for (auto& entry : entries_) {
                if (entry.state == TaskState::Pending) {
                    entry.state = TaskState::TimedOut;
                    stuck.push_back(entry.handle.taskIndex);
                    msg << ' ' << taskTag(entry.handle.taskIndex);
                }
            }
            throw IncompleteTaskError(std::move(stuck), msg.str());
        }

        clock_.sleepFor(interval);
    }
}

TaskState CompletionWatcher::state(std::size_t taskIndex) const {
    const auto it = std::find_if(entries_.begin(), entries_.end(),
                                 [taskIndex](const Entry& entry) { return entry.handle.taskIndex == taskIndex; });
    if (it == entries_.end()) {
        throw std::out_of_range("CompletionWatcher: task " + std::to_string(taskIndex) + " is not tracked");
    }
    return it->state;
}

std::size_t CompletionWatcher::doneCount() const {
    return static_cast<std::size_t>(std::count_if(entries_.begin(), entries_.end(), [](const Entry& entry) {
        return entry.state == TaskState::Done;
    }));
}

std::vector<std::size_t> CompletionWatcher::tasksInState(TaskState state) const {
    std::vector<std::size_t> tasks;
    for (const auto& entry : entries_) {
        if (entry.state == state) {
            tasks.push_back(entry.handle.taskIndex);
        }
    }
    return tasks;
}

}  // namespace tidalha
