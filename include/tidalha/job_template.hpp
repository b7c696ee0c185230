// filename: job_template.hpp
// part of Tidal Harmonic Analysis Driver
// MIT License

#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace tidalha {

/**
 * @brief How template lines are recognised as slots.
 *
 * A line is the entrypoint slot when it contains any entrypoint marker, and the
 * job name slot when it contains both the directive and the flag.
 */
struct TemplateMarkers {
    std::vector<std::string> entrypoint{"mvp", "~/bin", "@HA_ENTRYPOINT@"};
    std::string jobNameDirective{"#PBS"};
    std::string jobNameFlag{"-N"};
};

struct WorkerInvocation {
    std::string workerScript{"./ha_sub.pl"};
    std::string extractExecutable;
    std::string analysisExecutable;
    std::string constantsFile;
    std::size_t taskIndex{0};
    long startStack{0};
    long endStack{0};
    std::size_t nodeCount{0};
    std::string redirect{">&"};
    std::string logFile;
};

std::string renderWorkerCommand(const WorkerInvocation& invocation);

class JobTemplate {
public:
    enum class LineKind { Literal, Entrypoint, JobName };

    struct Line {
        LineKind kind{LineKind::Literal};
        std::string text;
    };

    static JobTemplate parse(const std::string& text, const TemplateMarkers& markers);
    static JobTemplate load(const std::string& path, const TemplateMarkers& markers);

    [[nodiscard]] const std::vector<Line>& lines() const { return lines_; }
    [[nodiscard]] std::size_t entrypointCount() const;
    [[nodiscard]] bool hasJobName() const;

    /**
     * @brief Produce the per-task script text.
     * @param jobName replaces every job name slot as "<directive> <flag> <jobName>".
     */
    [[nodiscard]] std::string render(const WorkerInvocation& invocation, const std::string& jobName) const;

private:
    std::vector<Line> lines_;
    TemplateMarkers markers_;
};

}  // namespace tidalha
