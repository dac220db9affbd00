#include <unordered_set>

#include "MZ_render.hpp"

void render_maze(ostream &out, const Maze &maze, const Solution &solution,
                 const ExploredSet &explored, bool show_explored) {
    unordered_set<Coordinate, CoordinateHash> on_path(solution.cells.begin(), solution.cells.end());

    for (int i = 0; i < maze.height; i++) {
        for (int j = 0; j < maze.width; j++) {
            Coordinate c(i, j);
            char symbol = RENDER_OPEN;

            if (maze.cells[i][j].blocked) {
                symbol = RENDER_WALL;
            } else if (c == maze.start) {
                symbol = RENDER_START;
            } else if (c == maze.goal) {
                symbol = RENDER_GOAL;
            } else if (on_path.count(c)) {
                symbol = RENDER_PATH;
            } else if (show_explored && explored.is_explored(c)) {
                symbol = RENDER_EXPLORED;
            }
            out << symbol;
        }
        out << '\n';
    }
}
