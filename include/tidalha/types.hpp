// filename: types.hpp
// part of Tidal Harmonic Analysis Driver
// MIT License

#pragma once

#include <cstddef>
#include <string>

namespace tidalha {

constexpr double kPi = 3.14159265358979323846;

// Value carried by every output node that no task resolved.
constexpr double kUnresolved = -9999.0;

constexpr double kDefaultInclusionThreshold = 0.1;

/**
 * @brief Zero-padded three digit task tag used in every per-task file name.
 */
std::string taskTag(std::size_t taskIndex);

// Per-task artifact names, all relative to the work directory.
std::string filterFileName(std::size_t taskIndex);
std::string scriptFileName(std::size_t taskIndex);
std::string consoleLogFileName(std::size_t taskIndex);
std::string partialResultFileName(const std::string& constituent, std::size_t taskIndex);

enum class FieldKind { Amplitude, Phase };

// amp_<const>.gr3 or pha_<const>.gr3 with the constituent lower-cased.
std::string outputFileName(FieldKind kind, const std::string& constituent);

}  // namespace tidalha
