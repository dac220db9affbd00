#pragma once

#include <vector>
#include <string>
#include <unordered_set>

#include "MZ_heap.hpp"
#include "MZ_structs.hpp"

using namespace std;

// -----------------------------------------------------------------------------
// Maze Representation
// -----------------------------------------------------------------------------

struct Maze {
    /*
     Represents the grid: a rectangular, row-major collection of cells plus
     the start and goal coordinates.
     The solver only reads it; nothing may modify it while a run is active.
    */

    string filename;

    // cells[i][j] is the cell at row i, column j.
    vector<vector<Cell>> cells;

    int width, height;
    Coordinate start, goal;

    Maze();

    // Parses a maze file. Symbols:
    //   A or S = start, B or G = goal, ' ' or '.' = open, '#' = wall.
    // Throws MazeFormatError on malformed input.
    void read_file_to_cells(string file);
    void read_lines_to_cells(const vector<string> &lines, string name = "<memory>");

    // Obstacle-free maze of h x w cells.
    void empty_maze(int h, int w, Coordinate start, Coordinate goal);
    void set_blocked(int i, int j, bool blocked = true);

    bool in_bounds(int i, int j) const;
    bool traversable(int i, int j) const;
    int count_open_cells() const;

    // Throws InvalidGrid if the maze is not searchable.
    void validate() const;
};

// -----------------------------------------------------------------------------
// Search Structures (DFS Components)
// -----------------------------------------------------------------------------

struct StackFrontier {
    /*
     The OPEN list of the depth-first search: append at the tail, remove
     from the tail (LIFO).
    */

    vector<ptrSearchNode> items;

    void add(ptrSearchNode node);

    // Removes and returns the most recently added node.
    // Throws EmptyFrontier when nothing is left.
    ptrSearchNode remove();

    bool empty() const;
    int size() const;

    // Linear scan over the queued nodes' coordinates.
    bool contains_state(const NodePool &pool, Coordinate c) const;

    void clear();
};

struct ExploredSet {
    /*
     The CLOSED list: coordinates already removed from the frontier and processed.
     'visited' answers membership in O(1); 'history' keeps the order in which
     coordinates were first marked, for rendering and reports.
    */

    unordered_set<Coordinate, CoordinateHash> visited;
    vector<Coordinate> history;

    // Idempotent.
    void mark_explored(Coordinate c);
    bool is_explored(Coordinate c) const;

    int size() const;
    void clear();
};

struct SearchTree {
    /*
     All per-run search state: the node arena, the frontier and the explored set.
     One instance belongs to exactly one solve() call.
    */

    NodePool pool;
    StackFrontier frontier;
    ExploredSet explored;

    bool open_is_empty() const;
    void add_to_open(ptrSearchNode node);
    ptrSearchNode get_node_from_open();
    void add_to_closed(ptrSearchNode node);

    // Already queued or already processed.
    bool was_seen(Coordinate c) const;

    void clear();
};
