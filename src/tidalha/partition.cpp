// filename: partition.cpp
// part of Tidal Harmonic Analysis Driver
// MIT License

#include "tidalha/partition.hpp"

#include "tidalha/errors.hpp"

#include <fstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace tidalha {

std::size_t TaskSlice::globalId(std::size_t localIndex) const {
    if (localIndex == 0 || localIndex > localToGlobal.size()) {
        throw std::out_of_range("Task " + std::to_string(taskIndex) + " has no local index " +
                                std::to_string(localIndex));
    }
    return localToGlobal[localIndex - 1];
}

std::vector<int> Partition::filterVector(std::size_t taskIndex) const {
    const TaskSlice& slice = task(taskIndex);
    std::vector<int> filter(nodeCount, 0);
    for (const std::size_t id : slice.localToGlobal) {
        filter.at(id - 1) = 1;
    }
    return filter;
}

Partition partitionActiveNodes(const std::vector<std::size_t>& activeNodes, std::size_t nodeCount,
                               std::size_t taskCount) {
    if (taskCount < 1) {
        throw std::invalid_argument("partitionActiveNodes: task count must be at least 1");
    }

    Partition partition{};
    partition.activeCount = activeNodes.size();
    partition.nodeCount = nodeCount;
    partition.perTask = partition.activeCount / taskCount;
    partition.lastTaskSize = partition.activeCount - (taskCount - 1) * partition.perTask;

    partition.tasks.reserve(taskCount);
    std::size_t offset = 0;
    for (std::size_t t = 1; t <= taskCount; ++t) {
        TaskSlice slice{};
        slice.taskIndex = t;
        slice.firstActive = offset;
        slice.count = (t < taskCount) ? partition.perTask : partition.lastTaskSize;
        slice.localToGlobal.reserve(slice.count);
        for (std::size_t k = 0; k < slice.count; ++k) {
            const std::size_t id = activeNodes[offset + k];
            if (id == 0 || id > nodeCount) {
                throw std::invalid_argument("partitionActiveNodes: node id " + std::to_string(id) +
                                            " outside mesh of " + std::to_string(nodeCount) + " nodes");
            }
            slice.localToGlobal.push_back(id);
        }
        offset += slice.count;
        partition.tasks.push_back(std::move(slice));
    }
    return partition;
}

void writeFilterFile(const std::string& path, const std::vector<int>& filter) {
    std::ofstream ofs(path, std::ios::trunc);
    if (!ofs.is_open()) {
        throw IOError("Failed to open filter output: " + path);
    }
    for (const int flag : filter) {
        ofs << flag << '\n';
    }
    ofs.close();
    if (!ofs) {
        throw IOError("Failed while writing filter file " + path);
    }
}

}  // namespace tidalha
