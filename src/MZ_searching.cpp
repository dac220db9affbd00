#include <fstream>
#include <sstream>
#include <algorithm>

#include "MZ_searching.hpp"
#include "common.hpp"
#include "errors.hpp"
#include "rassert.hpp"

// -----------------------------------------------------------------------------
// Maze Implementation
// -----------------------------------------------------------------------------

Maze::Maze() {
    width = 0;
    height = 0;
}

void Maze::read_file_to_cells(string _file) {
    /*
     Reads a maze description from a text file, one grid row per line.
     Parsing itself is shared with read_lines_to_cells().
    */

    ifstream file(_file);
    if (!file.is_open()) {
        throw MazeFormatError("cannot open file " + _file);
    }

    vector<string> lines;
    string line;
    while (getline(file, line)) {
        lines.push_back(line);
    }
    if (file.bad()) {
        throw MazeFormatError("cannot read file " + _file);
    }
    file.close();

    read_lines_to_cells(lines, _file);
}

void Maze::read_lines_to_cells(const vector<string> &lines, string name) {
    /*
     Builds the grid from text rows.

     Symbols:
       A / S = start (open)
       B / G = goal (open)
       ' ' / '.' = open
       '#' = wall
     Line endings ('\r', '\n') are ignored, as are trailing empty lines.
     Exactly one start and one goal must be present.
    */

    size_t last = lines.size();
    while (last > 0) {
        const string &l = lines[last - 1];
        if (l.find_first_not_of("\r\n") != string::npos) break;
        last--;
    }
    if (last == 0) {
        throw MazeFormatError(name + ": maze is empty");
    }

    vector<vector<Cell>> rows;
    int starts = 0, goals = 0;
    Coordinate s, g;

    for (size_t i = 0; i < last; i++) {
        vector<Cell> row;
        row.reserve(lines[i].length());

        for (char c : lines[i]) {
            if (c == '\r' || c == '\n') continue;

            int ci = (int)i;
            int cj = (int)row.size();

            switch (c) {
                case 'A':
                case 'S':
                    s = Coordinate(ci, cj);
                    starts++;
                    row.push_back(Cell(ci, cj, false));
                    break;
                case 'B':
                case 'G':
                    g = Coordinate(ci, cj);
                    goals++;
                    row.push_back(Cell(ci, cj, false));
                    break;
                case ' ':
                case '.':
                    row.push_back(Cell(ci, cj, false));
                    break;
                case '#':
                    row.push_back(Cell(ci, cj, true));
                    break;
                default:
                    throw MazeFormatError(name + ": unknown maze symbol '" + string(1, c) +
                                          "' at " + format_coordinate(Coordinate(ci, cj)));
            }
        }

        if (!rows.empty() && rows.back().size() != row.size()) {
            throw MazeFormatError(name + ": maze is not rectangular (row " + to_string(i) + ")");
        }
        rows.push_back(row);
    }

    if (starts == 0) throw MazeFormatError(name + ": no start point 'A' found in the maze");
    if (goals == 0) throw MazeFormatError(name + ": no end point 'B' found in the maze");
    if (starts > 1) throw MazeFormatError(name + ": more than one start point");
    if (goals > 1) throw MazeFormatError(name + ": more than one end point");

    int h = (int)rows.size();
    int w = (int)rows[0].size();
    if (h > MAX_MAZE_HEIGHT || w > MAX_MAZE_WIDTH) {
        throw MazeFormatError(name + ": maze dimensions exceed MAX_MAZE_HEIGHT/WIDTH");
    }

    filename = name;
    cells.swap(rows);
    height = h;
    width = w;
    start = s;
    goal = g;
}

void Maze::empty_maze(int h, int w, Coordinate _start, Coordinate _goal) {
    /*
     Generates an obstacle-free maze of the given dimensions.
    */
    filename = "<empty maze " + to_string(h) + "x" + to_string(w) + ">";

    cells.assign(h, vector<Cell>());
    for (int i = 0; i < h; i++) {
        cells[i].reserve(w);
        for (int j = 0; j < w; j++) {
            cells[i].push_back(Cell(i, j, false));
        }
    }
    height = h;
    width = w;
    start = _start;
    goal = _goal;
}

void Maze::set_blocked(int i, int j, bool blocked) {
    rassert(in_bounds(i, j), "set_blocked outside of the maze!");
    cells[i][j].blocked = blocked;
}

bool Maze::in_bounds(int i, int j) const {
    return (i >= 0 && i < height) && (j >= 0 && j < width);
}

bool Maze::traversable(int i, int j) const {
    return !cells[i][j].blocked;
}

int Maze::count_open_cells() const {
    int open = 0;
    for (const vector<Cell> &row : cells) {
        for (const Cell &c : row) {
            if (!c.blocked) open++;
        }
    }
    return open;
}

void Maze::validate() const {
    /*
     Rejects grids the search cannot run on.
     Called at the start of every solve(); failures are caller errors.
    */

    if (height <= 0 || width <= 0) {
        throw InvalidGrid("zero dimensions");
    }
    if ((int)cells.size() != height) {
        throw InvalidGrid("row count does not match height");
    }
    for (int i = 0; i < height; i++) {
        if ((int)cells[i].size() != width) {
            throw InvalidGrid("row " + to_string(i) + " does not match width");
        }
        for (int j = 0; j < width; j++) {
            if (cells[i][j].state != Coordinate(i, j)) {
                throw InvalidGrid("cell at " + format_coordinate(Coordinate(i, j)) +
                                  " stores coordinate " + format_coordinate(cells[i][j].state));
            }
        }
    }
    if (!in_bounds(start.i, start.j)) {
        throw InvalidGrid("start " + format_coordinate(start) + " is outside the maze");
    }
    if (!in_bounds(goal.i, goal.j)) {
        throw InvalidGrid("goal " + format_coordinate(goal) + " is outside the maze");
    }
    if (!traversable(start.i, start.j)) {
        throw InvalidGrid("start " + format_coordinate(start) + " is a wall");
    }
    if (!traversable(goal.i, goal.j)) {
        throw InvalidGrid("goal " + format_coordinate(goal) + " is a wall");
    }
}

// -----------------------------------------------------------------------------
// StackFrontier Implementation
// -----------------------------------------------------------------------------

void StackFrontier::add(ptrSearchNode node) {
    items.push_back(node);
}

ptrSearchNode StackFrontier::remove() {
    if (items.empty()) {
        throw EmptyFrontier();
    }
    ptrSearchNode node = items.back();
    items.pop_back();
    return node;
}

bool StackFrontier::empty() const {
    return items.empty();
}

int StackFrontier::size() const {
    return (int)items.size();
}

bool StackFrontier::contains_state(const NodePool &pool, Coordinate c) const {
    for (ptrSearchNode node : items) {
        if (pool[node].state == c) {
            return true;
        }
    }
    return false;
}

void StackFrontier::clear() {
    items.clear();
}

// -----------------------------------------------------------------------------
// ExploredSet Implementation
// -----------------------------------------------------------------------------

void ExploredSet::mark_explored(Coordinate c) {
    if (visited.insert(c).second) {
        history.push_back(c);
    }
}

bool ExploredSet::is_explored(Coordinate c) const {
    return visited.count(c) != 0;
}

int ExploredSet::size() const {
    return (int)visited.size();
}

void ExploredSet::clear() {
    visited.clear();
    history.clear();
}

// -----------------------------------------------------------------------------
// SearchTree (OPEN/CLOSED) Implementation
// -----------------------------------------------------------------------------

bool SearchTree::open_is_empty() const {
    return frontier.empty();
}

void SearchTree::add_to_open(ptrSearchNode node) {
    frontier.add(node);
}

ptrSearchNode SearchTree::get_node_from_open() {
    return frontier.remove();
}

void SearchTree::add_to_closed(ptrSearchNode node) {
    explored.mark_explored(pool[node].state);
}

bool SearchTree::was_seen(Coordinate c) const {
    // Cheap hash lookup first, linear frontier scan second.
    return explored.is_explored(c) || frontier.contains_state(pool, c);
}

void SearchTree::clear() {
    frontier.clear();
    explored.clear();
    pool.clear();
}
