// filename: task_launcher.cpp
// part of Tidal Harmonic Analysis Driver
// MIT License

#include "tidalha/task_launcher.hpp"

#include "tidalha/errors.hpp"
#include "tidalha/types.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>
#include <utility>

namespace tidalha {
namespace {

void removeIfPresent(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        throw IOError("Failed to remove stale file " + path.string() + ": " + ec.message());
    }
}

void writeScript(const std::string& path, const std::string& text) {
    std::ofstream ofs(path, std::ios::trunc);
    if (!ofs.is_open()) {
        throw IOError("Failed to open job script output: " + path);
    }
    ofs << text;
    ofs.close();
    if (!ofs) {
        throw IOError("Failed while writing job script " + path);
    }
    std::error_code ec;
    std::filesystem::permissions(path,
                                 std::filesystem::perms::owner_exec | std::filesystem::perms::group_exec,
                                 std::filesystem::perm_options::add, ec);
    if (ec) {
        std::cerr << "Warning: could not mark " << path << " executable: " << ec.message() << '\n';
    }
}

std::string pathFor(const std::string& workDir, const std::string& fileName) {
    return (std::filesystem::absolute(workDir) / fileName).lexically_normal().string();
}

JobHandle unsubmittedHandle(const TaskSlice& slice, const std::string& workDir) {
    JobHandle handle{};
    handle.taskIndex = slice.taskIndex;
    handle.scriptPath = pathFor(workDir, scriptFileName(slice.taskIndex));
    handle.logPath = pathFor(workDir, consoleLogFileName(slice.taskIndex));
    handle.nodeCount = slice.count;
    handle.submitted = false;
    return handle;
}

}  // namespace

void removeStaleTaskArtifacts(const std::string& workDir, std::size_t taskCount,
                              const std::vector<std::string>& constituents) {
    const std::filesystem::path dir(workDir);
    for (std::size_t t = 1; t <= taskCount; ++t) {
        removeIfPresent(dir / consoleLogFileName(t));
        removeIfPresent(dir / filterFileName(t));
        removeIfPresent(dir / scriptFileName(t));
        for (const auto& name : constituents) {
            removeIfPresent(dir / partialResultFileName(name, t));
        }
    }
}

TaskLauncher::TaskLauncher(LaunchOptions options, JobTemplate jobTemplate, JobSubmitter& submitter)
    : options_(std::move(options)), template_(std::move(jobTemplate)), submitter_(submitter) {}

std::string TaskLauncher::renderScript(const TaskSlice& slice) const {
    WorkerInvocation invocation{};
    invocation.workerScript = options_.workerScript;
    invocation.extractExecutable = options_.extractExecutable;
    invocation.analysisExecutable = options_.analysisExecutable;
    invocation.constantsFile = options_.constantsFile;
    invocation.taskIndex = slice.taskIndex;
    invocation.startStack = options_.startStack;
    invocation.endStack = options_.endStack;
    invocation.nodeCount = slice.count;
    invocation.redirect = options_.logRedirect;
    invocation.logFile = consoleLogFileName(slice.taskIndex);
    return template_.render(invocation, options_.jobNamePrefix + "_" + taskTag(slice.taskIndex));
}

const std::vector<JobHandle>& TaskLauncher::launch(const Partition& partition) {
    handles_.clear();
    handles_.reserve(partition.tasks.size());

    for (const auto& slice : partition.tasks) {
        writeFilterFile(pathFor(options_.workDir, filterFileName(slice.taskIndex)),
                        partition.filterVector(slice.taskIndex));

        JobHandle handle = unsubmittedHandle(slice, options_.workDir);
        writeScript(handle.scriptPath, renderScript(slice));

        if (slice.empty()) {
            if (!options_.quiet) {
                std::cout << "Task " << taskTag(slice.taskIndex) << " owns no nodes; not submitted\n";
            }
            handles_.push_back(handle);
            continue;
        }

        JobHandle submitted = submitter_.submit(slice.taskIndex, handle.scriptPath, handle.logPath);
        submitted.nodeCount = slice.count;
        handles_.push_back(submitted);
        if (!options_.quiet) {
            std::cout << "Submitted task " << taskTag(slice.taskIndex) << " (" << slice.count << " nodes)";
            if (!submitted.jobId.empty()) {
                std::cout << " as job " << submitted.jobId;
            }
            std::cout << '\n';
        }
    }
    return handles_;
}

std::vector<JobHandle> existingTaskHandles(const Partition& partition, const std::string& workDir) {
    std::vector<JobHandle> handles;
    handles.reserve(partition.tasks.size());
    for (const auto& slice : partition.tasks) {
        handles.push_back(unsubmittedHandle(slice, workDir));
    }
    return handles;
}

}  // namespace tidalha
