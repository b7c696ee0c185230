// filename: job_template.cpp
// part of Tidal Harmonic Analysis Driver
// MIT License

#include "tidalha/job_template.hpp"

#include "tidalha/errors.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <string>
#include <utility>

namespace tidalha {
namespace {

bool contains(const std::string& text, const std::string& needle) {
    return !needle.empty() && text.find(needle) != std::string::npos;
}

}  // namespace

std::string renderWorkerCommand(const WorkerInvocation& invocation) {
    std::ostringstream cmd;
    cmd << invocation.workerScript << ' ' << invocation.extractExecutable << ' '
        << invocation.analysisExecutable << ' ' << invocation.constantsFile << ' ' << invocation.taskIndex
        << ' ' << invocation.startStack << ' ' << invocation.endStack << ' ' << invocation.nodeCount;
    if (!invocation.logFile.empty()) {
        cmd << ' ' << invocation.redirect << ' ' << invocation.logFile;
    }
    return cmd.str();
}

JobTemplate JobTemplate::parse(const std::string& text, const TemplateMarkers& markers) {
    JobTemplate tmpl;
    tmpl.markers_ = markers;

    std::istringstream input(text);
    std::string raw;
    while (std::getline(input, raw)) {
        if (!raw.empty() && raw.back() == '\r') {
            raw.pop_back();
        }
        Line line{};
        line.text = raw;
        const bool entry = std::any_of(markers.entrypoint.begin(), markers.entrypoint.end(),
                                       [&raw](const std::string& marker) { return contains(raw, marker); });
        if (entry) {
            line.kind = LineKind::Entrypoint;
        } else if (contains(raw, markers.jobNameDirective) && contains(raw, markers.jobNameFlag)) {
            line.kind = LineKind::JobName;
        }
        tmpl.lines_.push_back(std::move(line));
    }

    if (tmpl.entrypointCount() == 0) {
        throw FormatError("Job template has no worker entrypoint line");
    }
    return tmpl;
}

JobTemplate JobTemplate::load(const std::string& path, const TemplateMarkers& markers) {
    std::ifstream input(path);
    if (!input) {
        throw IOError("Cannot open job template: " + path);
    }
    std::ostringstream text;
    text << input.rdbuf();
    try {
        return parse(text.str(), markers);
    } catch (const FormatError& ex) {
        throw FormatError(path + ": " + ex.what());
    }
}

std::size_t JobTemplate::entrypointCount() const {
    return static_cast<std::size_t>(std::count_if(lines_.begin(), lines_.end(), [](const Line& line) {
        return line.kind == LineKind::Entrypoint;
    }));
}

bool JobTemplate::hasJobName() const {
    return std::any_of(lines_.begin(), lines_.end(),
                       [](const Line& line) { return line.kind == LineKind::JobName; });
}

std::string JobTemplate::render(const WorkerInvocation& invocation, const std::string& jobName) const {
    const std::string command = renderWorkerCommand(invocation);
    std::ostringstream out;
    for (const auto& line : lines_) {
        switch (line.kind) {
            case LineKind::Entrypoint:
                out << command << '\n';
                break;
            case LineKind::JobName:
                out << markers_.jobNameDirective << ' ' << markers_.jobNameFlag << ' ' << jobName << '\n';
                break;
            case LineKind::Literal:
                out << line.text << '\n';
                break;
        }
    }
    return out.str();
}

}  // namespace tidalha
