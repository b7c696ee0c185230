// filename: run_config.hpp
// part of Tidal Harmonic Analysis Driver
// MIT License

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "tidalha/job_template.hpp"
#include "tidalha/types.hpp"

namespace tidalha {

struct RunConfig {
    std::string version{"0.1"};

    // Positional run inputs.
    std::string extractExecutable;
    std::string analysisExecutable;
    std::string jobTemplatePath;
    std::string constantsFile;
    std::size_t taskCount{0};
    long startStack{0};
    long endStack{0};

    std::string workDir{"."};
    std::string meshFile{"hgrid.gr3"};
    std::string maskFile{"include.gr3"};
    double inclusionThreshold{kDefaultInclusionThreshold};
    std::vector<std::string> constituents{"M2", "K1"};

    double pollIntervalSec{10.0};
    // Zero disables the deadline and polls until every task finishes.
    double maxWaitSec{48.0 * 3600.0};
    std::string completionMarker{"Done ha_sub"};

    std::string workerScript{"./ha_sub.pl"};
    std::string logRedirect{">&"};
    std::string submitCommand{"qsub"};
    std::string cancelCommand{"qdel"};
    std::string jobNamePrefix{"EXTRACT"};
    TemplateMarkers markers;

    bool assembleOnly{false};
    bool quiet{false};
};

/**
 * @brief Overlay the settings found in a JSON run configuration onto config.
 *
 * Only keys present in the file are changed.
 */
void applyRunConfigJson(const std::string& path, RunConfig& config);

RunConfig loadRunConfigFromJson(const std::string& path);

// Throws std::runtime_error naming the first invalid setting.
void validateRunConfig(const RunConfig& config);

}  // namespace tidalha
