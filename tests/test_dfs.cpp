// tests/test_dfs.cpp (doctest)

#include <doctest/doctest.h>

#include <cstdlib>
#include <sstream>
#include <string>
#include <unordered_set>
#include <vector>

#include "MZ_algorithms.hpp"
#include "errors.hpp"

#ifndef MAZE_DFS_MAPS_DIR
#define MAZE_DFS_MAPS_DIR "maps"
#endif

namespace maze_dfs_engine {

static Maze maze_from(const std::vector<std::string> &rows) {
    Maze maze;
    maze.read_lines_to_cells(rows);
    return maze;
}

static Maze maze_from_file(const std::string &name) {
    Maze maze;
    maze.read_file_to_cells(std::string(MAZE_DFS_MAPS_DIR) + "/" + name);
    return maze;
}

// Contiguous, wall-free, starts at start, ends at goal, one action per step.
static void check_valid_path(const Maze &maze, const Solution &s) {
    REQUIRE_FALSE(s.empty());
    REQUIRE(s.cells.size() == s.actions.size() + 1);
    CHECK(s.cells.front() == maze.start);
    CHECK(s.cells.back() == maze.goal);

    for (size_t k = 0; k < s.cells.size(); k++) {
        const Coordinate &c = s.cells[k];
        REQUIRE(maze.in_bounds(c.i, c.j));
        CHECK(maze.traversable(c.i, c.j));
        if (k > 0) {
            CHECK(apply_action(s.cells[k - 1], s.actions[k - 1]) == c);
        }
    }

    int manhattan = std::abs(maze.goal.i - maze.start.i) + std::abs(maze.goal.j - maze.start.j);
    CHECK(metric_length(s) >= manhattan);
    CHECK(replay_actions(maze.start, s.actions) == maze.goal);
}

static void check_unique_history(const ExploredSet &explored) {
    std::unordered_set<Coordinate, CoordinateHash> seen;
    for (const Coordinate &c : explored.history) {
        CHECK(seen.insert(c).second);
    }
    CHECK((int)explored.history.size() == explored.size());
}

} // namespace maze_dfs_engine

using maze_dfs_engine::maze_from;
using maze_dfs_engine::maze_from_file;
using maze_dfs_engine::check_valid_path;
using maze_dfs_engine::check_unique_history;

TEST_CASE("DFS: single corridor around a wall") {
    Maze maze = maze_from({"S..", "##.", "..G"});
    MazeSolver solver("corridor", &maze);
    CHECK(solver.state == SOLVER_READY);

    CHECK(solver.solve());
    CHECK(solver.state == SOLVER_SOLVED);

    std::vector<Coordinate> expected_cells = {
        Coordinate(0, 0), Coordinate(0, 1), Coordinate(0, 2), Coordinate(1, 2), Coordinate(2, 2)};
    std::vector<Action> expected_actions = {ACTION_RIGHT, ACTION_RIGHT, ACTION_DOWN, ACTION_DOWN};

    CHECK(solver.solution.cells == expected_cells);
    CHECK(solver.solution.actions == expected_actions);
    CHECK(solver.num_explored == 5);
    check_valid_path(maze, solver.solution);
}

TEST_CASE("DFS: start equal to goal") {
    Maze maze = maze_from({"...", ".SG", "..."});
    maze.goal = maze.start;

    MazeSolver solver("degenerate", &maze);
    CHECK(solver.solve());
    CHECK(solver.state == SOLVER_SOLVED);
    CHECK(solver.solution.actions.empty());
    REQUIRE(solver.solution.cells.size() == 1u);
    CHECK(solver.solution.cells[0] == maze.start);
    CHECK(solver.num_explored == 1);
    CHECK(solver.explored.is_explored(maze.start));
}

TEST_CASE("DFS: enclosed goal exhausts every reachable cell") {
    Maze maze = maze_from({
        "S...",
        ".#..",
        "#G#.",
        ".#..",
    });
    MazeSolver solver("enclosed", &maze);

    CHECK_FALSE(solver.solve());
    CHECK(solver.state == SOLVER_EXHAUSTED);
    CHECK(solver.solution.empty());
    CHECK(solver.solution.actions.empty());

    // (2,1) is the goal and (3,0) is cut off as well.
    CHECK(maze.count_open_cells() == 12);
    CHECK(solver.num_explored == 10);
    CHECK(solver.explored.size() == 10);
    CHECK_FALSE(solver.explored.is_explored(maze.goal));
    CHECK_FALSE(solver.explored.is_explored(Coordinate(3, 0)));
    check_unique_history(solver.explored);
}

TEST_CASE("DFS: wall splitting the maze yields no solution") {
    Maze maze = maze_from_file("no_path.txt");
    MazeSolver solver("split", &maze);

    CHECK_FALSE(solver.solve());
    CHECK(solver.state == SOLVER_EXHAUSTED);
    CHECK(solver.solution.empty());
    CHECK(solver.num_explored == 9);
    CHECK(solver.num_explored <= maze.count_open_cells());
    check_unique_history(solver.explored);
}

TEST_CASE("DFS: most recent branch is expanded first") {
    Maze maze;
    maze.empty_maze(3, 3, Coordinate(0, 0), Coordinate(2, 2));
    MazeSolver solver("open", &maze);

    REQUIRE(solver.solve());
    // "down" was pushed after "right", so it is followed first.
    CHECK(solver.solution.actions ==
          std::vector<Action>({ACTION_DOWN, ACTION_DOWN, ACTION_RIGHT, ACTION_RIGHT}));
    CHECK(solver.num_explored == 5);
    REQUIRE(solver.explored.history.size() == 5u);
    CHECK(solver.explored.history[1] == Coordinate(1, 0));
    CHECK(solver.explored.history.back() == maze.goal);
}

TEST_CASE("DFS: straight open corridor") {
    Maze maze;
    maze.empty_maze(1, 12, Coordinate(0, 0), Coordinate(0, 11));
    MazeSolver solver("row", &maze);

    REQUIRE(solver.solve());
    CHECK(metric_length(solver.solution) == 11);
    check_valid_path(maze, solver.solution);
}

TEST_CASE("DFS: bundled mazes produce valid paths") {
    const char *files[] = {"maze1.txt", "maze2.txt", "maze3.txt"};
    for (const char *f : files) {
        CAPTURE(f);
        Maze maze = maze_from_file(f);
        MazeSolver solver(f, &maze);

        REQUIRE(solver.solve());
        check_valid_path(maze, solver.solution);
        check_unique_history(solver.explored);
        CHECK(solver.num_explored <= maze.count_open_cells());
        CHECK(solver.nodes_created >= solver.num_explored);
    }
}

TEST_CASE("DFS: repeated solves are identical") {
    Maze maze = maze_from_file("maze2.txt");

    SUBCASE("deterministic order") {
        MazeSolver solver("repeat", &maze);
        REQUIRE(solver.solve());
        Solution first = solver.solution;
        int first_explored = solver.num_explored;
        std::vector<Coordinate> first_history = solver.explored.history;

        REQUIRE(solver.solve());
        CHECK(solver.solution.actions == first.actions);
        CHECK(solver.solution.cells == first.cells);
        CHECK(solver.num_explored == first_explored);
        CHECK(solver.explored.history == first_history);
    }

    SUBCASE("seeded shuffle") {
        SearchOptions options;
        options.shuffle_neighbors = true;
        options.seed = 99;

        MazeSolver a("shuffle-a", &maze, options);
        MazeSolver b("shuffle-b", &maze, options);
        REQUIRE(a.solve());
        REQUIRE(b.solve());
        CHECK(a.solution.cells == b.solution.cells);
        CHECK(a.num_explored == b.num_explored);

        REQUIRE(a.solve());
        CHECK(a.solution.cells == b.solution.cells);
        check_valid_path(maze, a.solution);
    }
}

TEST_CASE("DFS: invalid grid is rejected before searching") {
    Maze maze = maze_from({"S..", "...", "..G"});
    maze.set_blocked(2, 2);

    MazeSolver solver("bad", &maze);
    CHECK_THROWS_AS(solver.solve(), InvalidGrid);
    CHECK(solver.state == SOLVER_READY);
    CHECK(solver.num_explored == 0);

    Maze empty;
    MazeSolver nothing("empty", &empty);
    CHECK_THROWS_AS(nothing.solve(), InvalidGrid);
}

TEST_CASE("DFS: rejected rerun keeps previous results") {
    Maze maze = maze_from({"S..", "##.", "..G"});
    MazeSolver solver("rerun", &maze);
    REQUIRE(solver.solve());

    maze.goal = Coordinate(9, 9);
    CHECK_THROWS_AS(solver.solve(), InvalidGrid);
    CHECK(solver.state == SOLVER_SOLVED);
    CHECK(metric_length(solver.solution) == 4);
}

TEST_CASE("DFS: trace narrates frontier and removals") {
    Maze maze = maze_from({"SG"});
    std::ostringstream trace;

    SearchOptions options;
    options.trace = &trace;
    MazeSolver solver("trace", &maze, options);
    REQUIRE(solver.solve());

    std::string text = trace.str();
    CHECK(text.find("Frontier before remove:") != std::string::npos);
    CHECK(text.find("Node: (0, 0)") != std::string::npos);
    CHECK(text.find("Removed: (0, 0)") != std::string::npos);
    CHECK(text.find("Removed: (0, 1)") != std::string::npos);
}

TEST_CASE("DFS: silent without a trace stream") {
    Maze maze = maze_from({"SG"});
    MazeSolver solver("quiet", &maze);
    CHECK(solver.options.trace == nullptr);
    CHECK(solver.solve());
}

TEST_CASE("Solver: names and identifiers") {
    CHECK(algo_from_name("dfs") == ALGO_DFS);
    CHECK(algo_from_name("bfs") == -1);
    CHECK(solver_state_name(SOLVER_READY) == "Ready");
    CHECK(solver_state_name(SOLVER_EXHAUSTED) == "Exhausted");
}
