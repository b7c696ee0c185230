// filename: mesh_index.cpp
// part of Tidal Harmonic Analysis Driver
// MIT License

#include "tidalha/mesh_index.hpp"

#include "tidalha/errors.hpp"

#include <cstddef>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace tidalha {
namespace {

std::vector<std::string> readLines(const std::string& path) {
    std::ifstream input(path);
    if (!input) {
        throw IOError("Cannot open " + path);
    }
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(input, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    if (input.bad()) {
        throw IOError("Failed while reading " + path);
    }
    return lines;
}

void parseCounts(const std::string& path, const std::vector<std::string>& lines, std::size_t& ne,
                 std::size_t& np) {
    if (lines.size() < 2) {
        throw FormatError(path + ": missing element/node count line");
    }
    std::istringstream counts(lines[1]);
    long long elements = -1;
    long long nodes = -1;
    if (!(counts >> elements >> nodes) || elements < 0 || nodes < 0) {
        throw FormatError(path + ": line 2 must hold '<element_count> <node_count>'");
    }
    ne = static_cast<std::size_t>(elements);
    np = static_cast<std::size_t>(nodes);
}

MeshNode parseNodeRow(const std::string& path, const std::string& line, std::size_t lineNumber) {
    std::istringstream row(line);
    std::string idText;
    MeshNode node{};
    if (!(row >> idText >> node.xText >> node.yText) || !(row >> node.value)) {
        throw FormatError(path + ":" + std::to_string(lineNumber) +
                          ": expected '<id> <x> <y> <value>'");
    }
    try {
        node.x = std::stod(node.xText);
        node.y = std::stod(node.yText);
    } catch (const std::exception&) {
        throw FormatError(path + ":" + std::to_string(lineNumber) + ": invalid node coordinates");
    }
    return node;
}

}  // namespace

MeshLayout loadMeshLayout(const std::string& path) {
    const std::vector<std::string> lines = readLines(path);

    MeshLayout layout{};
    parseCounts(path, lines, layout.elementCount, layout.nodeCount);

    const std::size_t required = 2 + layout.nodeCount + layout.elementCount;
    if (lines.size() < required) {
        throw FormatError(path + ": header announces " + std::to_string(layout.nodeCount) + " nodes and " +
                          std::to_string(layout.elementCount) + " elements but file has only " +
                          std::to_string(lines.size()) + " lines");
    }

    layout.headerLines.assign(lines.begin(), lines.begin() + 2);
    layout.nodes.reserve(layout.nodeCount);
    for (std::size_t i = 0; i < layout.nodeCount; ++i) {
        MeshNode node = parseNodeRow(path, lines[i + 2], i + 3);
        node.id = i + 1;
        layout.nodes.push_back(std::move(node));
    }

    const auto elementsBegin = lines.begin() + static_cast<std::ptrdiff_t>(2 + layout.nodeCount);
    layout.elementLines.assign(elementsBegin,
                               elementsBegin + static_cast<std::ptrdiff_t>(layout.elementCount));
    return layout;
}

std::vector<double> loadNodeValues(const std::string& path, std::size_t expectedNodes) {
    const std::vector<std::string> lines = readLines(path);

    std::size_t ne = 0;
    std::size_t np = 0;
    parseCounts(path, lines, ne, np);
    if (np != expectedNodes) {
        throw FormatError(path + ": node count " + std::to_string(np) + " does not match mesh node count " +
                          std::to_string(expectedNodes));
    }
    if (lines.size() < 2 + np) {
        throw FormatError(path + ": expected " + std::to_string(np) + " node rows but found " +
                          std::to_string(lines.size() - 2));
    }

    std::vector<double> values;
    values.reserve(np);
    for (std::size_t i = 0; i < np; ++i) {
        values.push_back(parseNodeRow(path, lines[i + 2], i + 3).value);
    }
    return values;
}

MeshIndex::MeshIndex(MeshLayout layout, const std::vector<double>& maskValues, double threshold)
    : layout_(std::move(layout)) {
    if (maskValues.size() != layout_.nodeCount) {
        throw FormatError("Inclusion mask has " + std::to_string(maskValues.size()) +
                          " values but mesh has " + std::to_string(layout_.nodeCount) + " nodes");
    }
    included_.assign(layout_.nodeCount, false);
    for (std::size_t i = 0; i < layout_.nodeCount; ++i) {
        if (maskValues[i] > threshold) {
            included_[i] = true;
            active_.push_back(i + 1);
        }
    }
}

MeshIndex MeshIndex::load(const std::string& meshPath, const std::string& maskPath, double threshold) {
    MeshLayout layout = loadMeshLayout(meshPath);
    const std::vector<double> mask = loadNodeValues(maskPath, layout.nodeCount);
    return MeshIndex(std::move(layout), mask, threshold);
}

}  // namespace tidalha
