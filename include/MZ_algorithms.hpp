#pragma once

#include <string>

#include "MZ_structs.hpp"
#include "MZ_searching.hpp"
#include "MZ_search_params.hpp"

// Algorithm Identifiers
#define ALGO_DFS 0

// Solver lifecycle.
enum SolverState {
    SOLVER_READY,      // Constructed, no run finished yet.
    SOLVER_RUNNING,    // Inside solve().
    SOLVER_SOLVED,     // Last run found the goal.
    SOLVER_EXHAUSTED   // Last run emptied the frontier without reaching the goal.
};

string solver_state_name(SolverState state);

// Maps a --search value to an algorithm identifier. Returns -1 if unknown.
int algo_from_name(const string &name);

struct MazeSolver {
    /*
     A high-level wrapper that orchestrates one maze solving run: validation,
     the depth-first loop, path reconstruction and statistics.

     Each solve() call uses its own frontier, explored set and node arena, so
     independent solvers may run concurrently on mazes nobody mutates.
     Calling solve() again on the same solver discards the previous results.
    */

    string name;          // Name of the run (used in reports).
    const Maze *map;      // The maze, read-only.
    SearchOptions options;
    int algo;             // Selected algorithm (only ALGO_DFS).

    SolverState state;

    // Results of the last run
    Solution solution;
    ExploredSet explored;   // Every coordinate processed, in processing order.
    int num_explored;       // Nodes removed from the frontier.
    int nodes_created;      // Size of the node arena at the end of the run.
    bool is_solved;

    // Performance Statistics
    double search_time;
    double reconstruction_time;
    double total_runtime;

    MazeSolver(string name, const Maze *map, const SearchOptions &options = SearchOptions(),
               int algo = ALGO_DFS);

    // Runs the search. Returns true if a path was found.
    // Throws InvalidGrid if the maze is malformed; the solver state is left unchanged then.
    bool solve();

    // Exports results to a text report.
    void dump_result_of_search(string filename) const;
};
