// filename: partition.hpp
// part of Tidal Harmonic Analysis Driver
// MIT License

#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace tidalha {

struct TaskSlice {
    std::size_t taskIndex{0};    // 1-based
    std::size_t firstActive{0};  // 0-based offset into the active node list
    std::size_t count{0};
    // localToGlobal[k] is the global node id of local index k + 1.
    std::vector<std::size_t> localToGlobal;

    [[nodiscard]] bool empty() const { return count == 0; }

    /**
     * @brief Resolve a 1-based local index to its global node id.
     * @throws std::out_of_range when the index is outside 1..count.
     */
    [[nodiscard]] std::size_t globalId(std::size_t localIndex) const;
};

struct Partition {
    std::size_t activeCount{0};
    std::size_t nodeCount{0};
    std::size_t perTask{0};
    std::size_t lastTaskSize{0};
    std::vector<TaskSlice> tasks;

    [[nodiscard]] const TaskSlice& task(std::size_t taskIndex) const { return tasks.at(taskIndex - 1); }

    /**
     * @brief Full-length 0/1 vector over all mesh nodes marking the ones owned by a task.
     */
    [[nodiscard]] std::vector<int> filterVector(std::size_t taskIndex) const;
};

/**
 * @brief Split the active nodes into contiguous blocks of floor(T/N), the last task taking the rest.
 * @param activeNodes global ids in mesh order.
 * @param nodeCount total number of mesh nodes, used for the filter vectors.
 * @param taskCount number of tasks, must be at least 1.
 */
Partition partitionActiveNodes(const std::vector<std::size_t>& activeNodes, std::size_t nodeCount,
                               std::size_t taskCount);

void writeFilterFile(const std::string& path, const std::vector<int>& filter);

}  // namespace tidalha
