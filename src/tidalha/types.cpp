// filename: types.cpp
// part of Tidal Harmonic Analysis Driver
// MIT License

#include "tidalha/types.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace tidalha {

std::string taskTag(std::size_t taskIndex) {
    std::ostringstream tag;
    tag << std::setw(3) << std::setfill('0') << taskIndex;
    return tag.str();
}

std::string filterFileName(std::size_t taskIndex) {
    return "filter_flag_" + taskTag(taskIndex);
}

std::string scriptFileName(std::size_t taskIndex) {
    return "run_" + taskTag(taskIndex);
}

std::string consoleLogFileName(std::size_t taskIndex) {
    return "scrn.out_" + taskTag(taskIndex);
}

std::string partialResultFileName(const std::string& constituent, std::size_t taskIndex) {
    return constituent + "_" + taskTag(taskIndex);
}

std::string outputFileName(FieldKind kind, const std::string& constituent) {
    std::string lower = constituent;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return std::string(kind == FieldKind::Amplitude ? "amp_" : "pha_") + lower + ".gr3";
}

}  // namespace tidalha
