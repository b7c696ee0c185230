// filename: scheduler.hpp
// part of Tidal Harmonic Analysis Driver
// MIT License

#pragma once

#include <cstddef>
#include <string>
#include <utility>

namespace tidalha {

struct JobHandle {
    std::size_t taskIndex{0};
    std::string jobId;       // scheduler identifier, empty for tasks never submitted
    std::string scriptPath;
    std::string logPath;     // console log carrying the completion marker
    std::size_t nodeCount{0};
    bool submitted{false};
};

struct JobSubmitter {
    virtual ~JobSubmitter() = default;

    /**
     * @brief Hand a rendered job script to the batch scheduler.
     * @throws SubmissionError when the scheduler rejects the job.
     */
    virtual JobHandle submit(std::size_t taskIndex, const std::string& scriptPath, const std::string& logPath) = 0;

    // Best effort; returns false when the scheduler refused the cancel.
    virtual bool cancel(const JobHandle& handle) = 0;
};

struct JobWatcher {
    virtual ~JobWatcher() = default;
    virtual bool isComplete(const JobHandle& handle) = 0;
};

/**
 * @brief Submits through an external command such as qsub, run from the work directory.
 *
 * The first non-empty line the command prints is taken as the job id.
 */
class CommandJobSubmitter : public JobSubmitter {
public:
    CommandJobSubmitter(std::string workDir, std::string submitCommand, std::string cancelCommand);

    JobHandle submit(std::size_t taskIndex, const std::string& scriptPath, const std::string& logPath) override;
    bool cancel(const JobHandle& handle) override;

private:
    std::string workDir_;
    std::string submitCommand_;
    std::string cancelCommand_;
};

// Reports completion once the console log contains the marker string.
class LogMarkerWatcher : public JobWatcher {
public:
    explicit LogMarkerWatcher(std::string marker) : marker_(std::move(marker)) {}

    bool isComplete(const JobHandle& handle) override;

private:
    std::string marker_;
};

bool fileContainsMarker(const std::string& path, const std::string& marker);

std::string shellQuote(const std::string& value);

}  // namespace tidalha
