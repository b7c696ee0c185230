// filename: main.cpp
// part of Tidal Harmonic Analysis Driver
// MIT License

#include "tidalha/completion_watcher.hpp"
#include "tidalha/orchestrator.hpp"
#include "tidalha/run_config.hpp"
#include "tidalha/scheduler.hpp"

#include <csignal>
#include <cstddef>
#include <exception>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

volatile std::sig_atomic_t g_abort = 0;

void handleSignal(int) { g_abort = 1; }

void printUsage(const char* program) {
    std::cout << "Usage: " << program
              << " [--config PATH] [--work-dir DIR] [--poll-interval SEC] [--max-wait SEC]"
                 " [--assemble-only] [--quiet]\n"
                 "       <extract_exe> <analysis_exe> <job_template> <tidal_const_file>"
                 " <tasks> <start_stack> <end_stack>\n"
                 "Run in the directory holding hgrid.gr3 and include.gr3 (or pass --work-dir).\n"
                 "Outputs: amp_<const>.gr3, pha_<const>.gr3 for every constituent (default M2, K1).\n"
                 "Example: "
              << program
              << " /home/user/bin/read_output8_allnodes_simple /home/user/bin/tidal_analysis"
                 " /home/user/run_comb /home/user/tidal_const.dat 3 2 4\n";
}

bool parsePositiveDouble(const std::string& option, const char* text, double& value, bool allowZero) {
    try {
        std::size_t consumed = 0;
        value = std::stod(text, &consumed);
        if (consumed != std::string(text).size()) {
            throw std::invalid_argument(text);
        }
    } catch (const std::exception&) {
        std::cerr << option << " requires a valid floating-point argument\n";
        return false;
    }
    if (allowZero ? value < 0.0 : !(value > 0.0)) {
        std::cerr << option << (allowZero ? " must not be negative\n" : " must be positive\n");
        return false;
    }
    return true;
}

bool parseInteger(const std::string& name, const std::string& text, long& value) {
    try {
        std::size_t consumed = 0;
        value = std::stol(text, &consumed);
        if (consumed != text.size()) {
            throw std::invalid_argument(text);
        }
    } catch (const std::exception&) {
        std::cerr << name << " must be an integer, got '" << text << "'\n";
        return false;
    }
    return true;
}

}  // namespace

int main(int argc, char** argv) {
    using namespace tidalha;

    std::optional<std::string> configPath;
    std::optional<std::string> workDirOverride;
    std::optional<double> pollIntervalOverride;
    std::optional<double> maxWaitOverride;
    bool assembleOnly = false;
    bool quiet = false;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "--config requires a path argument\n";
                return 1;
            }
            configPath = std::string(argv[++i]);
        } else if (arg == "--work-dir") {
            if (i + 1 >= argc) {
                std::cerr << "--work-dir requires a directory argument\n";
                return 1;
            }
            workDirOverride = std::string(argv[++i]);
        } else if (arg == "--poll-interval") {
            if (i + 1 >= argc) {
                std::cerr << "--poll-interval requires a positive floating-point argument\n";
                return 1;
            }
            double value = 0.0;
            if (!parsePositiveDouble(arg, argv[++i], value, false)) {
                return 1;
            }
            pollIntervalOverride = value;
        } else if (arg == "--max-wait") {
            if (i + 1 >= argc) {
                std::cerr << "--max-wait requires a floating-point argument (0 waits forever)\n";
                return 1;
            }
            double value = 0.0;
            if (!parsePositiveDouble(arg, argv[++i], value, true)) {
                return 1;
            }
            maxWaitOverride = value;
        } else if (arg == "--assemble-only") {
            assembleOnly = true;
        } else if (arg == "--quiet") {
            quiet = true;
        } else if (arg.size() > 2 && arg.compare(0, 2, "--") == 0) {
            std::cerr << "Unknown option: " << arg << '\n';
            printUsage(argv[0]);
            return 1;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 7) {
        printUsage(argv[0]);
        return 1;
    }

    RunConfig config{};
    try {
        if (configPath) {
            applyRunConfigJson(*configPath, config);
        }
    } catch (const std::exception& ex) {
        std::cerr << "Failed to load run configuration: " << ex.what() << '\n';
        return 1;
    }

    config.extractExecutable = positional[0];
    config.analysisExecutable = positional[1];
    config.jobTemplatePath = positional[2];
    config.constantsFile = positional[3];

    long tasks = 0;
    if (!parseInteger("<tasks>", positional[4], tasks) ||
        !parseInteger("<start_stack>", positional[5], config.startStack) ||
        !parseInteger("<end_stack>", positional[6], config.endStack)) {
        return 1;
    }
    if (tasks < 1) {
        std::cerr << "<tasks> must be at least 1\n";
        return 1;
    }
    config.taskCount = static_cast<std::size_t>(tasks);

    if (workDirOverride) {
        config.workDir = *workDirOverride;
    }
    if (pollIntervalOverride) {
        config.pollIntervalSec = *pollIntervalOverride;
    }
    if (maxWaitOverride) {
        config.maxWaitSec = *maxWaitOverride;
    }
    config.assembleOnly = assembleOnly;
    config.quiet = quiet;

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    CommandJobSubmitter submitter(config.workDir, config.submitCommand, config.cancelCommand);
    LogMarkerWatcher watcher(config.completionMarker);
    SteadyPollClock clock;
    RunServices services{submitter, watcher, clock, [] { return g_abort != 0; }};

    try {
        const RunSummary summary = runHarmonicAnalysis(config, services);
        if (!quiet) {
            std::cout << "Assembled " << summary.activeCount << " node(s) from " << summary.taskCount
                      << " task(s) into " << summary.outputs.size() << " file(s)\n";
        }
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << '\n';
        return 1;
    }
    return 0;
}
