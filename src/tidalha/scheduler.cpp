// filename: scheduler.cpp
// part of Tidal Harmonic Analysis Driver
// MIT License

#include "tidalha/scheduler.hpp"

#include "tidalha/errors.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>

namespace tidalha {
namespace {

std::string readCapture(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return {};
    }
    std::ostringstream text;
    text << input.rdbuf();
    return text.str();
}

std::string firstNonEmptyLine(const std::string& text) {
    std::istringstream lines(text);
    std::string line;
    while (std::getline(lines, line)) {
        const auto begin = line.find_first_not_of(" \t\r");
        if (begin == std::string::npos) {
            continue;
        }
        const auto end = line.find_last_not_of(" \t\r");
        return line.substr(begin, end - begin + 1);
    }
    return {};
}

}  // namespace

std::string shellQuote(const std::string& value) {
    std::string quoted = "'";
    for (const char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

CommandJobSubmitter::CommandJobSubmitter(std::string workDir, std::string submitCommand,
                                         std::string cancelCommand)
    : workDir_(std::move(workDir)),
      submitCommand_(std::move(submitCommand)),
      cancelCommand_(std::move(cancelCommand)) {}

JobHandle CommandJobSubmitter::submit(std::size_t taskIndex, const std::string& scriptPath,
                                      const std::string& logPath) {
    namespace fs = std::filesystem;

    const fs::path capturePath = fs::path(scriptPath).string() + ".submit";
    const std::string command = "cd " + shellQuote(workDir_) + " && " + submitCommand_ + " " +
                                shellQuote(scriptPath) + " > " + shellQuote(capturePath.string()) + " 2>&1";

    const int rc = std::system(command.c_str());
    const std::string output = readCapture(capturePath);
    std::error_code ec;
    fs::remove(capturePath, ec);

    if (rc != 0) {
        throw SubmissionError(taskIndex, "Task " + std::to_string(taskIndex) + ": '" + submitCommand_ + " " +
                                             scriptPath + "' failed with exit code " + std::to_string(rc) +
                                             (output.empty() ? std::string{} : ": " + firstNonEmptyLine(output)));
    }

    JobHandle handle{};
    handle.taskIndex = taskIndex;
    handle.jobId = firstNonEmptyLine(output);
    handle.scriptPath = scriptPath;
    handle.logPath = logPath;
    handle.submitted = true;
    return handle;
}

bool CommandJobSubmitter::cancel(const JobHandle& handle) {
    if (!handle.submitted || handle.jobId.empty() || cancelCommand_.empty()) {
        return false;
    }
    const std::string command = cancelCommand_ + " " + shellQuote(handle.jobId);
    const int rc = std::system(command.c_str());
    if (rc != 0) {
        std::cerr << "Warning: '" << command << "' failed with exit code " << rc << '\n';
        return false;
    }
    return true;
}

bool fileContainsMarker(const std::string& path, const std::string& marker) {
    std::ifstream input(path);
    if (!input) {
        return false;
    }
    std::string line;
    while (std::getline(input, line)) {
        if (line.find(marker) != std::string::npos) {
            return true;
        }
    }
    return false;
}

bool LogMarkerWatcher::isComplete(const JobHandle& handle) {
    return fileContainsMarker(handle.logPath, marker_);
}

}  // namespace tidalha
