// filename: mesh_index.hpp
// part of Tidal Harmonic Analysis Driver
// MIT License

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "tidalha/types.hpp"

namespace tidalha {

struct MeshNode {
    std::size_t id{0};  // 1-based global index
    double x{0.0};
    double y{0.0};
    double value{0.0};
    // Coordinates exactly as written in the mesh file, re-emitted in outputs.
    std::string xText;
    std::string yText;
};

/**
 * @brief Text layout of a gr3 mesh file.
 *
 * headerLines holds the title line and the "<ne> <np>" count line verbatim,
 * elementLines holds the element connectivity block verbatim.
 */
struct MeshLayout {
    std::vector<std::string> headerLines;
    std::size_t elementCount{0};
    std::size_t nodeCount{0};
    std::vector<MeshNode> nodes;
    std::vector<std::string> elementLines;
};

MeshLayout loadMeshLayout(const std::string& path);

/**
 * @brief Read only the per-node value column of a gr3 file.
 * @param expectedNodes node count the mask must agree with.
 */
std::vector<double> loadNodeValues(const std::string& path, std::size_t expectedNodes);

class MeshIndex {
public:
    MeshIndex(MeshLayout layout, const std::vector<double>& maskValues,
              double threshold = kDefaultInclusionThreshold);

    static MeshIndex load(const std::string& meshPath, const std::string& maskPath,
                          double threshold = kDefaultInclusionThreshold);

    [[nodiscard]] const MeshLayout& layout() const { return layout_; }
    [[nodiscard]] std::size_t nodeCount() const { return layout_.nodeCount; }
    [[nodiscard]] const MeshNode& node(std::size_t globalId) const { return layout_.nodes.at(globalId - 1); }

    // Global ids of included nodes in mesh file order.
    [[nodiscard]] const std::vector<std::size_t>& activeNodes() const { return active_; }
    [[nodiscard]] bool isActive(std::size_t globalId) const { return included_.at(globalId - 1); }

private:
    MeshLayout layout_;
    std::vector<bool> included_;
    std::vector<std::size_t> active_;
};

}  // namespace tidalha
