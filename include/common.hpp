#pragma once

// -----------------------------------------------------------------------------
// Global Constants and Dimensions
// -----------------------------------------------------------------------------

// Number of discrete moves available from a cell (up, left, right, down).
#define NUM_ACTIONS 4

// Maximum dimensions of the maze grid.
// The loader rejects anything larger; the engine itself has no hard limit.
#define MAX_MAZE_WIDTH 4096
#define MAX_MAZE_HEIGHT 4096

// Initial capacity of the node arena.
// The arena grows on demand, this only avoids early reallocations.
#define INITIAL_POOL_SIZE 1024

// Default seed for the optional neighbor shuffle.
#define DEFAULT_SHUFFLE_SEED 12345
