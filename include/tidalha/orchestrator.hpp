// filename: orchestrator.hpp
// part of Tidal Harmonic Analysis Driver
// MIT License

#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "tidalha/completion_watcher.hpp"
#include "tidalha/run_config.hpp"
#include "tidalha/scheduler.hpp"

namespace tidalha {

struct RunServices {
    JobSubmitter& submitter;
    JobWatcher& watcher;
    PollClock& clock;
    std::function<bool()> abortRequested;
};

struct RunSummary {
    std::size_t nodeCount{0};
    std::size_t activeCount{0};
    std::size_t taskCount{0};
    std::size_t perTask{0};
    std::size_t lastTaskSize{0};
    std::size_t submittedJobs{0};
    std::vector<std::string> outputs;
};

/**
 * @brief Partition, launch, wait for every task, then assemble the output fields.
 *
 * No output file is written unless every task reported completion. Jobs still
 * outstanding when a step fails are cancelled before the error propagates.
 */
RunSummary runHarmonicAnalysis(const RunConfig& config, RunServices services);

// Cancels every submitted handle accepted by the predicate; returns the number cancelled.
std::size_t cancelOutstanding(JobSubmitter& submitter, const std::vector<JobHandle>& handles,
                              const std::function<bool(const JobHandle&)>& shouldCancel);

}  // namespace tidalha
