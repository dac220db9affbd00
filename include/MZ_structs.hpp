#pragma once

#include <vector>
#include <string>
#include <cstddef>
#include <functional>

using namespace std;

// -----------------------------------------------------------------------------
// Data Structures
// -----------------------------------------------------------------------------

struct Coordinate {
    /*
     Identifies a single grid cell.
     'i' is the row index (top to bottom), 'j' is the column index (left to right).
     Both are non-negative for any cell inside the maze; neighbor generation may
     produce out-of-range candidates, which are filtered before use.
    */

    int i, j;

    Coordinate();
    Coordinate(int i, int j);

    bool operator==(const Coordinate &other) const;
    bool operator!=(const Coordinate &other) const;
};

struct CoordinateHash {
    // Hash functor for unordered containers keyed by Coordinate.
    size_t operator()(const Coordinate &c) const;
};

// Discrete moves. The numeric order is the neighbor generation order.
enum Action {
    ACTION_NONE = -1,   // Root node: nothing was done to reach it.
    ACTION_UP = 0,
    ACTION_LEFT = 1,
    ACTION_RIGHT = 2,
    ACTION_DOWN = 3
};

// Row/column deltas indexed by Action (ACTION_UP .. ACTION_DOWN).
extern const int ACTION_DI[];
extern const int ACTION_DJ[];

// "up", "left", "right", "down" ("" for ACTION_NONE).
string action_name(Action a);

// Inverse of action_name(). Returns ACTION_NONE for unknown names.
Action action_from_name(const string &name);

// The cell reached from 'c' by taking action 'a' (no bounds checking).
Coordinate apply_action(Coordinate c, Action a);

// Applies every action in order, starting at 'start'.
Coordinate replay_actions(Coordinate start, const vector<Action> &actions);

struct Cell {
    /*
     A grid cell: its own coordinate plus the wall flag.
     Invariant (checked by Maze::validate): 'state' equals the cell's position in the grid.
    */

    Coordinate state;
    bool blocked;

    Cell();
    Cell(int i, int j, bool blocked);
};

struct Solution {
    /*
     Start-to-goal path discovered by the search.

     'cells' starts with the start coordinate and then holds the cell reached by
     each action, so cells.size() == actions.size() + 1 for a found path.
     Both vectors are empty when no path exists.
    */

    vector<Action> actions;
    vector<Coordinate> cells;

    bool empty() const;
    bool contains(Coordinate c) const;
    void clear();
};

// Number of moves of a solution (0 for start == goal or no solution).
int metric_length(const Solution &solution);

// "(i, j)"
string format_coordinate(const Coordinate &c);
