// filename: result_assembler.hpp
// part of Tidal Harmonic Analysis Driver
// MIT License

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "tidalha/mesh_index.hpp"
#include "tidalha/partition.hpp"
#include "tidalha/types.hpp"

namespace tidalha {

struct PartialRow {
    std::size_t localIndex{0};
    double amplitude{0.0};
    double phaseRad{0.0};
};

/**
 * @brief Parse a partial result file of "<local_index> <ignored> <amplitude> <phase_radians>" rows.
 */
std::vector<PartialRow> readPartialResult(const std::string& path);

struct AssembledField {
    std::string constituent;
    // Indexed by global id - 1, phase in degrees.
    std::vector<double> amplitude;
    std::vector<double> phaseDeg;
};

class ResultAssembler {
public:
    ResultAssembler(const MeshIndex& mesh, const Partition& partition, std::vector<std::string> constituents);

    /**
     * @brief Scatter one task's rows for one constituent into the global fields.
     * @throws FormatError when a local index is outside the task's range.
     */
    void mergeRows(std::size_t taskIndex, const std::string& constituent, const std::vector<PartialRow>& rows);

    // Read and merge every constituent file of one task from workDir.
    void mergeTask(std::size_t taskIndex, const std::string& workDir);

    void mergeAll(const std::string& workDir);

    /**
     * @brief Write amp_<const>.gr3 and pha_<const>.gr3 for every constituent.
     * @return paths written, amplitude before phase for each constituent.
     *
     * Files are staged as <name>.tmp and renamed once all of them are written;
     * on failure none of the outputs is left behind.
     */
    std::vector<std::string> writeOutputs(const std::string& workDir) const;

    [[nodiscard]] const AssembledField& field(const std::string& constituent) const;
    [[nodiscard]] const std::vector<AssembledField>& fields() const { return fields_; }
    [[nodiscard]] std::size_t unresolvedCount(const std::string& constituent) const;

private:
    AssembledField& mutableField(const std::string& constituent);
    void writeField(const std::string& path, const std::vector<double>& values) const;

    const MeshIndex& mesh_;
    const Partition& partition_;
    std::vector<AssembledField> fields_;
};

}  // namespace tidalha
