// filename: task_launcher.hpp
// part of Tidal Harmonic Analysis Driver
// MIT License

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "tidalha/job_template.hpp"
#include "tidalha/partition.hpp"
#include "tidalha/scheduler.hpp"

namespace tidalha {

struct LaunchOptions {
    std::string workDir{"."};
    std::string workerScript{"./ha_sub.pl"};
    std::string extractExecutable;
    std::string analysisExecutable;
    std::string constantsFile;
    long startStack{0};
    long endStack{0};
    std::string logRedirect{">&"};
    std::string jobNamePrefix{"EXTRACT"};
    bool quiet{false};
};

/**
 * @brief Remove per-task files left by an earlier run in workDir.
 *
 * Old console logs would otherwise satisfy the completion barrier immediately.
 */
void removeStaleTaskArtifacts(const std::string& workDir, std::size_t taskCount,
                              const std::vector<std::string>& constituents);

// Handles for tasks run earlier from workDir, used when only assembling.
std::vector<JobHandle> existingTaskHandles(const Partition& partition, const std::string& workDir);

class TaskLauncher {
public:
    TaskLauncher(LaunchOptions options, JobTemplate jobTemplate, JobSubmitter& submitter);

    /**
     * @brief Write filter files and scripts for every task and submit the non-empty ones.
     *
     * Handles are recorded as they are created, so handles() lists every job already
     * submitted when a later submission throws.
     */
    const std::vector<JobHandle>& launch(const Partition& partition);

    [[nodiscard]] const std::vector<JobHandle>& handles() const { return handles_; }

    // Script text for one task, without writing or submitting it.
    [[nodiscard]] std::string renderScript(const TaskSlice& slice) const;

private:
    LaunchOptions options_;
    JobTemplate template_;
    JobSubmitter& submitter_;
    std::vector<JobHandle> handles_;
};

}  // namespace tidalha
