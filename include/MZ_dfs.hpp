#pragma once

#include <vector>

#include "MZ_heap.hpp"

struct ResultSearch {
    /*
     Encapsulates the result of the search loop.
    */

    bool path_found;           // True if the goal was removed from the frontier.
    int steps;                 // Number of nodes removed from the frontier (explored-count).
    ptrSearchNode final_node;  // The goal node (start of the parent chain for reconstruction).

    ResultSearch() : path_found(false), steps(0), final_node(NULL_Node) {}

    ResultSearch(bool path_found, int steps, ptrSearchNode final_node)
        : path_found(path_found), steps(steps), final_node(final_node) {}
};

template <typename T>
static inline void add_start_node_to_open(T *params) {
    /*
     Initializes the search by creating the root node (no parent, no action)
     and pushing it to the frontier.

     Template Parameter T:
        A struct (e.g., MazeSearchParams) that provides:
        - get_start_node()
        - is_goal(node)
        - get_successors(node, list)
        - trace_frontier(), trace_removed(node)
        - ast (pointer to SearchTree)
    */

    params->ast->add_to_open(params->get_start_node());
}

template <typename T>
static inline ptrSearchNode StepDfs(T *params, vector<ptrSearchNode> &succ_list) {
    /*
     Performs a single iteration of the depth-first search:
     1. Removes the most recent node from the frontier.
     2. Checks if the goal is reached.
     3. Marks the node explored.
     4. Pushes every unseen neighbor, in generation order.

     The caller guarantees the frontier is not empty.

     Returns:
        - The goal node if the target is reached.
        - NULL_Node otherwise (search continues).
    */

    params->trace_frontier();

    ptrSearchNode current = params->ast->get_node_from_open();
    params->trace_removed(current);

    if (params->is_goal(current)) {
        return current;
    }

    params->ast->add_to_closed(current);

    succ_list.clear();
    params->get_successors(current, succ_list);

    for (ptrSearchNode new_node : succ_list) {
        params->ast->add_to_open(new_node);
    }

    return NULL_Node;
}

template <typename T>
ResultSearch DepthFirstSearch(T *params) {
    /*
     Executes the complete depth-first loop until the goal is found or the
     frontier is exhausted. Exhaustion is a normal outcome, not an error.
     Every reachable cell is removed from the frontier at most once, so the
     loop ends after at most (number of open cells) steps.
    */

    add_start_node_to_open(params);

    vector<ptrSearchNode> succ_list;
    int step_count = 0;

    while (!params->ast->open_is_empty()) {
        step_count++;

        ptrSearchNode result_node = StepDfs(params, succ_list);

        if (result_node != NULL_Node) {
            return ResultSearch(true, step_count, result_node);
        }
    }

    // Frontier exhausted, no path exists.
    return ResultSearch(false, step_count, NULL_Node);
}
