// filename: partition_preview.cpp
// part of Tidal Harmonic Analysis Driver
// MIT License

#include "tidalha/mesh_index.hpp"
#include "tidalha/partition.hpp"
#include "tidalha/types.hpp"

#include <cstddef>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

void printUsage() {
    std::cout << "partition_preview <mesh.gr3> <include.gr3> <tasks> [--threshold VALUE]\n"
              << "  Prints the node slice every task would own; nothing is written or submitted.\n";
}

}  // namespace

int main(int argc, char** argv) {
    using namespace tidalha;

    if (argc != 4 && argc != 6) {
        printUsage();
        return 1;
    }

    double threshold = kDefaultInclusionThreshold;
    if (argc == 6) {
        if (std::string(argv[4]) != "--threshold") {
            printUsage();
            return 1;
        }
        try {
            threshold = std::stod(argv[5]);
        } catch (const std::exception&) {
            std::cerr << "--threshold requires a valid floating-point argument\n";
            return 1;
        }
    }

    long tasks = 0;
    try {
        tasks = std::stol(argv[3]);
    } catch (const std::exception&) {
        std::cerr << "<tasks> must be an integer\n";
        return 1;
    }
    if (tasks < 1) {
        std::cerr << "<tasks> must be at least 1\n";
        return 1;
    }

    try {
        const MeshIndex mesh = MeshIndex::load(argv[1], argv[2], threshold);
        const Partition partition =
            partitionActiveNodes(mesh.activeNodes(), mesh.nodeCount(), static_cast<std::size_t>(tasks));

        std::cout << "mesh nodes: " << mesh.nodeCount() << ", active: " << partition.activeCount
                  << ", per task: " << partition.perTask << ", last task: " << partition.lastTaskSize << '\n';
        std::cout << std::left << std::setw(6) << "task" << std::setw(10) << "nodes" << std::setw(12)
                  << "first_id" << "last_id\n";
        for (const auto& slice : partition.tasks) {
            std::cout << std::setw(6) << taskTag(slice.taskIndex) << std::setw(10) << slice.count;
            if (slice.empty()) {
                std::cout << std::setw(12) << "-" << "-\n";
            } else {
                std::cout << std::setw(12) << slice.localToGlobal.front() << slice.localToGlobal.back() << '\n';
            }
        }
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << '\n';
        return 1;
    }
    return 0;
}
