// filename: orchestrator.cpp
// part of Tidal Harmonic Analysis Driver
// MIT License

#include "tidalha/orchestrator.hpp"

#include "tidalha/job_template.hpp"
#include "tidalha/mesh_index.hpp"
#include "tidalha/partition.hpp"
#include "tidalha/result_assembler.hpp"
#include "tidalha/task_launcher.hpp"
#include "tidalha/types.hpp"

#include <filesystem>
#include <iostream>
#include <utility>

namespace tidalha {
namespace {

LaunchOptions launchOptionsFrom(const RunConfig& config) {
    LaunchOptions options{};
    options.workDir = config.workDir;
    options.workerScript = config.workerScript;
    options.extractExecutable = config.extractExecutable;
    options.analysisExecutable = config.analysisExecutable;
    options.constantsFile = config.constantsFile;
    options.startStack = config.startStack;
    options.endStack = config.endStack;
    options.logRedirect = config.logRedirect;
    options.jobNamePrefix = config.jobNamePrefix;
    options.quiet = config.quiet;
    return options;
}

}  // namespace

std::size_t cancelOutstanding(JobSubmitter& submitter, const std::vector<JobHandle>& handles,
                              const std::function<bool(const JobHandle&)>& shouldCancel) {
    std::size_t cancelled = 0;
    for (const auto& handle : handles) {
        if (!handle.submitted || (shouldCancel && !shouldCancel(handle))) {
            continue;
        }
        if (submitter.cancel(handle)) {
            ++cancelled;
        } else {
            std::cerr << "Warning: could not cancel task " << taskTag(handle.taskIndex);
            if (!handle.jobId.empty()) {
                std::cerr << " (job " << handle.jobId << ")";
            }
            std::cerr << '\n';
        }
    }
    return cancelled;
}

RunSummary runHarmonicAnalysis(const RunConfig& config, RunServices services) {
    namespace fs = std::filesystem;

    validateRunConfig(config);

    const fs::path workDir(config.workDir);
    const MeshIndex mesh = MeshIndex::load((workDir / config.meshFile).string(),
                                           (workDir / config.maskFile).string(), config.inclusionThreshold);

    RunSummary summary{};
    summary.nodeCount = mesh.nodeCount();
    summary.activeCount = mesh.activeNodes().size();
    if (!config.quiet) {
        std::cout << "# of output pts= " << summary.activeCount << " (of " << summary.nodeCount
                  << " mesh nodes)\n";
    }

    const Partition partition = partitionActiveNodes(mesh.activeNodes(), mesh.nodeCount(), config.taskCount);
    summary.taskCount = partition.tasks.size();
    summary.perTask = partition.perTask;
    summary.lastTaskSize = partition.lastTaskSize;
    if (!config.quiet) {
        std::cout << "Partitioned into " << summary.taskCount << " task(s): " << summary.perTask
                  << " nodes each, last task " << summary.lastTaskSize << '\n';
    }

    std::vector<JobHandle> handles;
    if (config.assembleOnly) {
        handles = existingTaskHandles(partition, config.workDir);
    } else {
        JobTemplate jobTemplate = JobTemplate::load(config.jobTemplatePath, config.markers);
        if (!jobTemplate.hasJobName()) {
            std::cerr << "Warning: job template " << config.jobTemplatePath
                      << " has no job name line; jobs keep the template name\n";
        }
        removeStaleTaskArtifacts(config.workDir, partition.tasks.size(), config.constituents);

        TaskLauncher launcher(launchOptionsFrom(config), std::move(jobTemplate), services.submitter);
        try {
            handles = launcher.launch(partition);
        } catch (const std::exception& ex) {
            std::cerr << "Launch failed: " << ex.what() << '\n';
            const std::size_t cancelled = cancelOutstanding(services.submitter, launcher.handles(), nullptr);
            std::cerr << "Cancelled " << cancelled << " submitted job(s)\n";
            throw;
        }
    }
    for (const auto& handle : handles) {
        if (handle.submitted) {
            ++summary.submittedJobs;
        }
    }

    WatchOptions watchOptions{};
    watchOptions.pollIntervalSec = config.pollIntervalSec;
    watchOptions.maxWaitSec = config.maxWaitSec;
    watchOptions.quiet = config.quiet;
    watchOptions.abortRequested = services.abortRequested;

    CompletionWatcher watcher(services.watcher, services.clock, watchOptions);
    try {
        watcher.waitForAll(handles);
    } catch (const std::exception& ex) {
        std::cerr << "Waiting for tasks failed: " << ex.what() << '\n';
        const std::size_t cancelled = cancelOutstanding(
            services.submitter, handles,
            [&watcher](const JobHandle& handle) { return watcher.state(handle.taskIndex) != TaskState::Done; });
        if (cancelled > 0) {
            std::cerr << "Cancelled " << cancelled << " outstanding job(s)\n";
        }
        throw;
    }

    if (!config.quiet) {
        std::cout << "Done all HA; starting final assembly...\n";
    }

    ResultAssembler assembler(mesh, partition, config.constituents);
    assembler.mergeAll(config.workDir);
    summary.outputs = assembler.writeOutputs(config.workDir);

    if (!config.quiet) {
        for (const auto& name : config.constituents) {
            const std::size_t unresolved = assembler.unresolvedCount(name);
            if (unresolved > 0) {
                std::cout << name << ": " << unresolved << " node(s) left at " << kUnresolved << '\n';
            }
        }
        for (const auto& path : summary.outputs) {
            std::cout << "Wrote " << path << '\n';
        }
    }
    return summary;
}

}  // namespace tidalha
