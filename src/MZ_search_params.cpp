#include <algorithm>

#include "MZ_search_params.hpp"
#include "errors.hpp"
#include "rassert.hpp"

// -----------------------------------------------------------------------------
// MazeSearchParams Implementation
// -----------------------------------------------------------------------------

MazeSearchParams::MazeSearchParams(const Maze *map, const SearchOptions &options) {
    if (map == nullptr) {
        throw InvalidGrid("no maze given");
    }
    map->validate();

    this->task_map = map;
    this->options = options;
    this->rng.seed(options.seed);
    this->ast = new SearchTree();
}

ptrSearchNode MazeSearchParams::get_start_node() {
    return ast->pool.new_SearchNode(task_map->start, NULL_Node, ACTION_NONE);
}

bool MazeSearchParams::is_goal(ptrSearchNode node) const {
    return ast->pool[node].state == task_map->goal;
}

void MazeSearchParams::get_neighbors(Coordinate c, vector<Neighbor> &list) {
    /*
     A candidate is valid iff it lies inside the maze and is not a wall.
     The candidate order fixes the exploration bias of the search, so it must
     stay up, left, right, down.
    */

    list.clear();
    for (int a = ACTION_UP; a <= ACTION_DOWN; a++) {
        Action action = (Action)a;
        Coordinate next = apply_action(c, action);

        if (task_map->in_bounds(next.i, next.j) && task_map->traversable(next.i, next.j)) {
            Neighbor n;
            n.state = next;
            n.action = action;
            list.push_back(n);
        }
    }

    if (options.shuffle_neighbors) {
        shuffle(list.begin(), list.end(), rng);
    }
}

void MazeSearchParams::get_successors(ptrSearchNode current, vector<ptrSearchNode> &list) {
    vector<Neighbor> neighbors;
    get_neighbors(ast->pool[current].state, neighbors);

    for (const Neighbor &n : neighbors) {
        // A coordinate is queued at most once per run.
        // The four neighbors are distinct cells, so checking before any of them
        // is pushed is enough.
        if (!ast->was_seen(n.state)) {
            list.push_back(ast->pool.new_SearchNode(n.state, current, n.action));
        }
    }
}

void MazeSearchParams::trace_frontier() const {
    if (options.trace == nullptr) return;

    ostream &out = *options.trace;
    out << "Frontier before remove:" << endl;
    for (ptrSearchNode node : ast->frontier.items) {
        out << "Node: " << format_coordinate(ast->pool[node].state) << endl;
    }
}

void MazeSearchParams::trace_removed(ptrSearchNode node) const {
    if (options.trace == nullptr) return;

    ostream &out = *options.trace;
    out << "Removed: " << format_coordinate(ast->pool[node].state) << endl;
    out << "---------" << endl;
    out << endl;
}

MazeSearchParams::~MazeSearchParams() {
    delete ast;
}
