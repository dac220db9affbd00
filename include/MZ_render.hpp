#pragma once

#include <ostream>

#include "MZ_structs.hpp"
#include "MZ_searching.hpp"

// Symbols used by render_maze().
#define RENDER_WALL '#'
#define RENDER_START 'A'
#define RENDER_GOAL 'B'
#define RENDER_PATH '*'
#define RENDER_EXPLORED 'o'
#define RENDER_OPEN ' '

// Prints the maze row by row. Solution cells are drawn as RENDER_PATH; when
// 'show_explored' is set, explored cells off the path are drawn as RENDER_EXPLORED.
void render_maze(ostream &out, const Maze &maze, const Solution &solution,
                 const ExploredSet &explored, bool show_explored = false);
