#include <algorithm>
#include <sstream>

#include "MZ_structs.hpp"
#include "common.hpp"
#include "rassert.hpp"

// -----------------------------------------------------------------------------
// Coordinate
// -----------------------------------------------------------------------------

Coordinate::Coordinate() : i(0), j(0) {}

Coordinate::Coordinate(int i, int j) : i(i), j(j) {}

bool Coordinate::operator==(const Coordinate &other) const {
    return i == other.i && j == other.j;
}

bool Coordinate::operator!=(const Coordinate &other) const {
    return !(*this == other);
}

size_t CoordinateHash::operator()(const Coordinate &c) const {
    // Row and column both fit in 32 bits; pack them into one 64-bit key.
    unsigned long long key = ((unsigned long long)(unsigned int)c.i << 32) | (unsigned int)c.j;
    return std::hash<unsigned long long>()(key);
}

string format_coordinate(const Coordinate &c) {
    stringstream ss;
    ss << "(" << c.i << ", " << c.j << ")";
    return ss.str();
}

// -----------------------------------------------------------------------------
// Actions
// -----------------------------------------------------------------------------

//                          up  left right down
const int ACTION_DI[NUM_ACTIONS] = {-1,  0,  0,  1};
const int ACTION_DJ[NUM_ACTIONS] = { 0, -1,  1,  0};

string action_name(Action a) {
    switch (a) {
        case ACTION_UP:    return "up";
        case ACTION_LEFT:  return "left";
        case ACTION_RIGHT: return "right";
        case ACTION_DOWN:  return "down";
        default:           return "";
    }
}

Action action_from_name(const string &name) {
    if (name == "up") return ACTION_UP;
    if (name == "left") return ACTION_LEFT;
    if (name == "right") return ACTION_RIGHT;
    if (name == "down") return ACTION_DOWN;
    return ACTION_NONE;
}

Coordinate apply_action(Coordinate c, Action a) {
    rassert(a >= 0 && a < NUM_ACTIONS, "Cannot apply ACTION_NONE!");
    return Coordinate(c.i + ACTION_DI[a], c.j + ACTION_DJ[a]);
}

Coordinate replay_actions(Coordinate start, const vector<Action> &actions) {
    Coordinate c = start;
    for (Action a : actions) {
        c = apply_action(c, a);
    }
    return c;
}

// -----------------------------------------------------------------------------
// Cell
// -----------------------------------------------------------------------------

Cell::Cell() : state(), blocked(false) {}

Cell::Cell(int i, int j, bool blocked) : state(i, j), blocked(blocked) {}

// -----------------------------------------------------------------------------
// Solution
// -----------------------------------------------------------------------------

bool Solution::empty() const {
    return cells.empty();
}

bool Solution::contains(Coordinate c) const {
    return find(cells.begin(), cells.end(), c) != cells.end();
}

void Solution::clear() {
    actions.clear();
    cells.clear();
}

int metric_length(const Solution &solution) {
    return (int)solution.actions.size();
}
