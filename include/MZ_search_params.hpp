#pragma once

#include <ostream>
#include <random>

#include "MZ_structs.hpp"
#include "MZ_heap.hpp"
#include "MZ_searching.hpp"
#include "common.hpp"

struct SearchOptions {
    /*
     Run-time knobs of the solver.
    */

    // Shuffle the valid neighbors of each expanded cell before queuing them.
    // Off by default: exploration then follows the fixed up/left/right/down order.
    bool shuffle_neighbors = false;

    // Seed of the shuffle; every solve() restarts the generator from it.
    unsigned int seed = DEFAULT_SHUFFLE_SEED;

    // When set, a per-step trace of the frontier is written here.
    ostream *trace = nullptr;
};

struct Neighbor {
    Coordinate state;
    Action action;
};

struct MazeSearchParams {
    /*
     Encapsulates the context of one depth-first run over a maze and provides
     the search loop with its domain logic (start node, goal test, successors).
    */

    const Maze *task_map;
    SearchOptions options;

    SearchTree *ast;    // Per-run OPEN/CLOSED state, owned by this object.
    mt19937 rng;        // Only used when options.shuffle_neighbors is set.

    MazeSearchParams(const Maze *map, const SearchOptions &options);

    ptrSearchNode get_start_node();
    bool is_goal(ptrSearchNode node) const;

    // Valid moves from 'c' in generation order (up, left, right, down),
    // shuffled afterwards if enabled.
    void get_neighbors(Coordinate c, vector<Neighbor> &list);

    // Creates nodes for every neighbor that is neither queued nor explored.
    void get_successors(ptrSearchNode current, vector<ptrSearchNode> &list);

    void trace_frontier() const;
    void trace_removed(ptrSearchNode node) const;

    ~MazeSearchParams();

    MazeSearchParams(const MazeSearchParams &) = delete;
    MazeSearchParams &operator=(const MazeSearchParams &) = delete;
};
