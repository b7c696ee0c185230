// filename: result_assembler.cpp
// part of Tidal Harmonic Analysis Driver
// MIT License

#include "tidalha/result_assembler.hpp"

#include "tidalha/errors.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace tidalha {
namespace {

// Accepts the nan and inf tokens the analysis code prints for unresolvable nodes.
bool parseReal(const std::string& text, double& value) {
    char* end = nullptr;
    value = std::strtod(text.c_str(), &end);
    return end != text.c_str() && *end == '\0';
}

void removeQuietly(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
}

}  // namespace

std::vector<PartialRow> readPartialResult(const std::string& path) {
    std::ifstream input(path);
    if (!input) {
        throw IOError("Cannot open " + path);
    }

    std::vector<PartialRow> rows;
    std::string line;
    std::size_t lineNumber = 0;
    while (std::getline(input, line)) {
        ++lineNumber;
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        std::istringstream fields(line);
        long long local = 0;
        std::string ignored;
        std::string amplitudeText;
        std::string phaseText;
        PartialRow row{};
        if (!(fields >> local >> ignored >> amplitudeText >> phaseText) || local < 1 ||
            !parseReal(amplitudeText, row.amplitude) || !parseReal(phaseText, row.phaseRad)) {
            throw FormatError(path + ":" + std::to_string(lineNumber) +
                              ": expected '<local_index> <value> <amplitude> <phase>'");
        }
        row.localIndex = static_cast<std::size_t>(local);
        rows.push_back(row);
    }
    if (input.bad()) {
        throw IOError("Failed while reading " + path);
    }
    return rows;
}

ResultAssembler::ResultAssembler(const MeshIndex& mesh, const Partition& partition,
                                 std::vector<std::string> constituents)
    : mesh_(mesh), partition_(partition) {
    if (partition.nodeCount != mesh.nodeCount()) {
        throw std::invalid_argument("ResultAssembler: partition built for a different mesh");
    }
    fields_.reserve(constituents.size());
    for (auto& name : constituents) {
        AssembledField field{};
        field.constituent = std::move(name);
        field.amplitude.assign(mesh.nodeCount(), kUnresolved);
        field.phaseDeg.assign(mesh.nodeCount(), kUnresolved);
        fields_.push_back(std::move(field));
    }
}

const AssembledField& ResultAssembler::field(const std::string& constituent) const {
    const auto it = std::find_if(fields_.begin(), fields_.end(),
                                 [&constituent](const AssembledField& f) { return f.constituent == constituent; });
    if (it == fields_.end()) {
        throw std::out_of_range("ResultAssembler: unknown constituent " + constituent);
    }
    return *it;
}

AssembledField& ResultAssembler::mutableField(const std::string& constituent) {
    const auto it = std::find_if(fields_.begin(), fields_.end(),
                                 [&constituent](const AssembledField& f) { return f.constituent == constituent; });
    if (it == fields_.end()) {
        throw std::out_of_range("ResultAssembler: unknown constituent " + constituent);
    }
    return *it;
}

void ResultAssembler::mergeRows(std::size_t taskIndex, const std::string& constituent,
                                const std::vector<PartialRow>& rows) {
    const TaskSlice& slice = partition_.task(taskIndex);
    AssembledField& target = mutableField(constituent);
    for (const auto& row : rows) {
        if (row.localIndex < 1 || row.localIndex > slice.count) {
            throw FormatError(partialResultFileName(constituent, taskIndex) + ": local index " +
                              std::to_string(row.localIndex) + " outside task range 1.." +
                              std::to_string(slice.count));
        }
        const std::size_t globalId = slice.globalId(row.localIndex);
        target.amplitude[globalId - 1] = row.amplitude;
        target.phaseDeg[globalId - 1] = row.phaseRad * 180.0 / kPi;
    }
}

void ResultAssembler::mergeTask(std::size_t taskIndex, const std::string& workDir) {
    if (partition_.task(taskIndex).empty()) {
        return;
    }
    for (const auto& f : fields_) {
        const std::filesystem::path path =
            std::filesystem::path(workDir) / partialResultFileName(f.constituent, taskIndex);
        mergeRows(taskIndex, f.constituent, readPartialResult(path.string()));
    }
}

void ResultAssembler::mergeAll(const std::string& workDir) {
    for (const auto& slice : partition_.tasks) {
        mergeTask(slice.taskIndex, workDir);
    }
}

std::size_t ResultAssembler::unresolvedCount(const std::string& constituent) const {
    const AssembledField& f = field(constituent);
    return static_cast<std::size_t>(std::count(f.amplitude.begin(), f.amplitude.end(), kUnresolved));
}

void ResultAssembler::writeField(const std::string& path, const std::vector<double>& values) const {
    std::ofstream ofs(path, std::ios::trunc);
    if (!ofs.is_open()) {
        throw IOError("Failed to open output: " + path);
    }

    const MeshLayout& layout = mesh_.layout();
    for (const auto& line : layout.headerLines) {
        ofs << line << '\n';
    }
    ofs << std::setprecision(15);
    for (const auto& node : layout.nodes) {
        ofs << node.id << ' ' << node.xText << ' ' << node.yText << ' ' << values[node.id - 1] << '\n';
    }
    for (const auto& line : layout.elementLines) {
        ofs << line << '\n';
    }

    ofs.close();
    if (!ofs) {
        throw IOError("Failed while writing " + path);
    }
}

std::vector<std::string> ResultAssembler::writeOutputs(const std::string& workDir) const {
    namespace fs = std::filesystem;

    struct Pending {
        fs::path target;
        fs::path staging;
        const std::vector<double>* values;
    };
    std::vector<Pending> pending;
    for (const auto& f : fields_) {
        const fs::path amp = fs::path(workDir) / outputFileName(FieldKind::Amplitude, f.constituent);
        const fs::path pha = fs::path(workDir) / outputFileName(FieldKind::Phase, f.constituent);
        pending.push_back({amp, amp.string() + ".tmp", &f.amplitude});
        pending.push_back({pha, pha.string() + ".tmp", &f.phaseDeg});
    }

    // Every field is staged before any output is replaced, so a failure leaves no partial set.
    const auto discardStaging = [&pending]() {
        for (const auto& item : pending) {
            removeQuietly(item.staging);
        }
    };
    try {
        for (const auto& item : pending) {
            if (fs::is_directory(item.target)) {
                throw IOError("Output path is a directory: " + item.target.string());
            }
            writeField(item.staging.string(), *item.values);
        }
    } catch (const std::exception&) {
        discardStaging();
        throw;
    }

    std::vector<std::string> written;
    for (const auto& item : pending) {
        std::error_code ec;
        fs::rename(item.staging, item.target, ec);
        if (ec) {
            for (const auto& path : written) {
                removeQuietly(path);
            }
            discardStaging();
            throw IOError("Failed to move " + item.staging.string() + " to " + item.target.string() + ": " +
                          ec.message());
        }
        written.push_back(item.target.string());
    }
    return written;
}

}  // namespace tidalha
