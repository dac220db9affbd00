#include <ctime>
#include <fstream>
#include <algorithm>
#include <stdexcept>

#include "MZ_algorithms.hpp"
#include "MZ_dfs.hpp"
#include "rassert.hpp"

string solver_state_name(SolverState state) {
    switch (state) {
        case SOLVER_READY:     return "Ready";
        case SOLVER_RUNNING:   return "Running";
        case SOLVER_SOLVED:    return "Solved";
        case SOLVER_EXHAUSTED: return "Exhausted";
    }
    return "Unknown";
}

int algo_from_name(const string &name) {
    if (name == "dfs") return ALGO_DFS;
    return -1;
}

// -----------------------------------------------------------------------------
// MazeSolver Implementation
// -----------------------------------------------------------------------------

MazeSolver::MazeSolver(string name, const Maze *map, const SearchOptions &options, int algo) {
    this->name = name;
    this->map = map;
    this->options = options;
    this->algo = algo;

    this->state = SOLVER_READY;
    this->num_explored = 0;
    this->nodes_created = 0;
    this->is_solved = false;

    this->search_time = 0.0;
    this->reconstruction_time = 0.0;
    this->total_runtime = 0.0;
}

static inline void reconstruct_path(const ResultSearch &result, const MazeSearchParams &params,
                                    MazeSolver *search) {
    /*
     Walks the parent chain from the goal node back to the root, then reverses
     the collected sequences so they read start to goal.
     The root contributes its coordinate but no action.
    */

    search->solution.clear();
    if (!result.path_found) {
        return;
    }

    const NodePool &pool = params.ast->pool;
    ptrSearchNode current = result.final_node;

    while (pool[current].parent != NULL_Node) {
        const SearchNode &node = pool[current];
        search->solution.actions.push_back(node.action);
        search->solution.cells.push_back(node.state);
        current = node.parent;
    }
    search->solution.cells.push_back(pool[current].state);

    reverse(search->solution.actions.begin(), search->solution.actions.end());
    reverse(search->solution.cells.begin(), search->solution.cells.end());

    rassert(search->solution.cells.front() == search->map->start,
            "Parent chain does not end at the start cell!");
    rassert(replay_actions(search->map->start, search->solution.actions) == search->map->goal,
            "Reconstructed actions do not lead to the goal!");
}

bool MazeSolver::solve() {
    /*
     Main execution method.
     Validation happens before anything is reset, so a rejected maze leaves
     the previous results untouched.
    */

    rassert(algo == ALGO_DFS, "Unknown algorithm identifier!");

    // Validates the maze (throws InvalidGrid) and owns the per-run state.
    MazeSearchParams params(map, options);

    state = SOLVER_RUNNING;
    solution.clear();
    explored.clear();
    num_explored = 0;
    nodes_created = 0;
    is_solved = false;

    double t0 = (double)clock();
    ResultSearch result = DepthFirstSearch(&params);
    search_time = ((double)clock() - t0) / CLOCKS_PER_SEC;

    t0 = (double)clock();
    reconstruct_path(result, params, this);
    reconstruction_time = ((double)clock() - t0) / CLOCKS_PER_SEC;

    total_runtime = search_time + reconstruction_time;

    // The goal node is never closed by the loop; record it so renderers see
    // every cell the run touched.
    if (result.path_found) {
        params.ast->explored.mark_explored(map->goal);
    }

    explored = params.ast->explored;
    num_explored = result.steps;
    nodes_created = params.ast->pool.size();
    is_solved = result.path_found;
    state = is_solved ? SOLVER_SOLVED : SOLVER_EXHAUSTED;

    return is_solved;
}

void MazeSolver::dump_result_of_search(string filename) const {
    /*
     Writes the search results to a report file.
    */

    ofstream file(filename);
    if (!file.is_open()) {
        throw runtime_error("Cannot write result file " + filename);
    }

    file << "=== Results: Depth-First Search ===" << endl;
    file << "Run: " << name << endl;
    file << "Parameters:" << endl;
    file << "  Maze: " << map->filename << " (" << map->height << "x" << map->width << ")" << endl;
    file << "  Neighbor Shuffle: " << (options.shuffle_neighbors ? "Enabled" : "Disabled");
    if (options.shuffle_neighbors) file << " (seed " << options.seed << ")";
    file << endl;

    file << "Problem Instance:" << endl;
    file << "  Start: " << format_coordinate(map->start) << endl;
    file << "  Goal:  " << format_coordinate(map->goal) << endl;

    file << "Metrics:" << endl;
    file << "  Outcome: " << solver_state_name(state) << endl;
    file << "  Solved: " << (is_solved ? "Yes" : "No") << endl;
    file << "  Explored Nodes: " << num_explored << endl;
    file << "  Created Nodes: " << nodes_created << endl;
    file << "  Search Time (s): " << search_time << endl;
    file << "  Reconstruction Time (s): " << reconstruction_time << endl;
    file << "  Total Time (s): " << total_runtime << endl;
    file << "  Path Length (moves): " << metric_length(solution) << endl;

    file << "--------------------" << endl;
    file << "Action Sequence:" << endl;
    for (Action a : solution.actions) {
        file << action_name(a) << " ";
    }
    file << endl;
    file << "Cell Sequence:" << endl;
    for (const Coordinate &c : solution.cells) {
        file << format_coordinate(c) << " ";
    }
    file << endl;

    file.close();
}
