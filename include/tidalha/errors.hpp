// filename: errors.hpp
// part of Tidal Harmonic Analysis Driver
// MIT License

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace tidalha {

struct Error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Missing or unreadable input, or an output that cannot be written.
struct IOError : Error {
    using Error::Error;
};

// Record count mismatch or unparsable row.
struct FormatError : Error {
    using Error::Error;
};

// The scheduler rejected a job.
struct SubmissionError : Error {
    SubmissionError(std::size_t task, const std::string& what) : Error(what), taskIndex(task) {}

    std::size_t taskIndex{0};
};

// One or more tasks did not report completion before the deadline.
struct IncompleteTaskError : Error {
    IncompleteTaskError(std::vector<std::size_t> tasks, const std::string& what)
        : Error(what), taskIndices(std::move(tasks)) {}

    std::vector<std::size_t> taskIndices;
};

struct RunAbortedError : Error {
    using Error::Error;
};

}  // namespace tidalha
