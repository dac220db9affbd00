#include <iostream>
#include <string>
#include <stdexcept>

// System headers
#include <getopt.h>

#include "MZ_structs.hpp"
#include "MZ_searching.hpp"
#include "MZ_search_params.hpp"
#include "MZ_algorithms.hpp"
#include "MZ_render.hpp"
#include "common.hpp"

using namespace std;

// =============================================================================
// MODE: SINGLE RUN
// =============================================================================

static int solve_maze_file(string maze_file, int algo, const SearchOptions &options,
                           bool show_explored, string out_file) {
    Maze maze;
    maze.read_file_to_cells(maze_file);

    MazeSolver solver("dfs", &maze, options, algo);

    cout << "Starting to solve maze with Depth First Search" << endl;
    cout << "Goal is " << format_coordinate(maze.goal) << endl;

    solver.solve();

    if (solver.is_solved) {
        cout << "Solution: " << endl;
        render_maze(cout, maze, solver.solution, solver.explored, show_explored);
        cout << "Solution is " << metric_length(solver.solution) << " steps." << endl;
        cout << "Time to solve: " << solver.total_runtime << "s" << endl;
    } else {
        cout << "No solution found" << endl;
    }
    cout << "Explored " << solver.num_explored << " nodes" << endl;

    if (!out_file.empty()) {
        solver.dump_result_of_search(out_file);
        cout << "Results written to " << out_file << endl;
    }
    return 0;
}

// =============================================================================
// MAIN & PARSING
// =============================================================================

void print_help() {
    cout << "Maze DFS Solver\n";
    cout << "Usage:\n";
    cout << "   ./maze_dfs --file <maze.txt> [--search dfs] [--shuffle] [--seed <n>] \\\n";
    cout << "              [--debug] [--show-explored] [--out <report.txt>]\n\n";
    cout << "Maze symbols: A/S start, B/G goal, '#' wall, ' '/'.' open.\n";
    cout << "   Example:\n";
    cout << "   ./maze_dfs --file maps/maze1.txt --show-explored\n";
}

int main(int argc, char* argv[]) {
    string maze_file = "maze.txt";
    string search_type = "dfs";
    string out_file;
    bool show_explored = false;
    bool debug = false;
    SearchOptions options;

    static struct option long_options[] = {
        {"file",          required_argument, 0, 'f'},
        {"search",        required_argument, 0, 's'},
        {"shuffle",       no_argument,       0, 'r'},
        {"seed",          required_argument, 0, 'e'},
        {"debug",         no_argument,       0, 'd'},
        {"show-explored", no_argument,       0, 'x'},
        {"out",           required_argument, 0, 'o'},
        {"help",          no_argument,       0, 'h'},
        {0, 0, 0, 0}
    };

    int opt_idx = 0;
    while (true) {
        int c = getopt_long(argc, argv, "f:s:h", long_options, &opt_idx);
        if (c == -1) break;
        switch (c) {
            case 'f': maze_file = optarg; break;
            case 's': search_type = optarg; break;
            case 'r': options.shuffle_neighbors = true; break;
            case 'e':
                try {
                    options.seed = (unsigned int)stoul(optarg);
                } catch (const exception &) {
                    cerr << "Error: Invalid seed: " << optarg << endl;
                    return 1;
                }
                break;
            case 'd': debug = true; break;
            case 'x': show_explored = true; break;
            case 'o': out_file = optarg; break;
            case 'h': print_help(); return 0;
            default: print_help(); return 1;
        }
    }

    int algo = algo_from_name(search_type);
    if (algo < 0) {
        cerr << "Unknown search type: " << search_type << endl;
        return 1;
    }

    if (debug) {
        options.trace = &cout;
    }

    try {
        return solve_maze_file(maze_file, algo, options, show_explored, out_file);
    } catch (const exception &e) {
        cerr << "Error: " << e.what() << endl;
        return 1;
    }
}
