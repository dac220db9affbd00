#pragma once

#include <stdexcept>
#include <string>

// -----------------------------------------------------------------------------
// Error Types
// -----------------------------------------------------------------------------
// Unlike rassert (internal invariants, may be compiled out), these are always
// thrown and are part of the public contract.

struct EmptyFrontier : public std::runtime_error {
    /*
     Raised when removing from an empty frontier.
     The search loop checks emptiness before removing, so this never escapes
     MazeSolver::solve(); exhaustion is reported as "no solution" instead.
    */
    EmptyFrontier() : std::runtime_error("empty frontier") {}
};

struct InvalidGrid : public std::runtime_error {
    /*
     Precondition violation: the maze handed to the solver is malformed
     (zero dimensions, start/goal out of bounds or blocked, ...).
    */
    explicit InvalidGrid(const std::string &message)
        : std::runtime_error("Invalid grid: " + message) {}
};

struct MazeFormatError : public std::runtime_error {
    /*
     The textual maze description could not be turned into a grid.
    */
    explicit MazeFormatError(const std::string &message)
        : std::runtime_error("Maze format error: " + message) {}
};
