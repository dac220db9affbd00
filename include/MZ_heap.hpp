#pragma once

#include <vector>

#include "MZ_structs.hpp"

// -----------------------------------------------------------------------------
// Node Arena Definitions
// -----------------------------------------------------------------------------

// Null-handle equivalent (the root node has no parent).
#define NULL_Node ptrSearchNode(-1)

using namespace std;

struct ptrSearchNode {
    /*
     A handle acting as an index into a NodePool.
     Parent links are stored as handles rather than raw pointers, so the pool
     may grow (reallocate) freely while the search is running, and the node
     graph has a single owner: the pool.
    */

    int ind;  // Index of the SearchNode within NodePool::nodes.

    ptrSearchNode();
    ptrSearchNode(int i);
    bool operator==(ptrSearchNode other) const;
    bool operator!=(ptrSearchNode other) const;
};

struct SearchNode {
    /*
     A point reached during the search, decorated with how it was reached.
     Nodes are only created for coordinates that were neither explored nor
     queued, so following 'parent' always terminates at the root.
    */

    Coordinate state;       // Grid cell this node stands for.
    ptrSearchNode parent;   // Predecessor (NULL_Node for the root).
    Action action;          // Move taken from 'parent' to reach 'state'.

    SearchNode();
    SearchNode(Coordinate state, ptrSearchNode parent, Action action);
};

struct NodePool {
    /*
     Growable arena owning every SearchNode created during one run.
     Nodes are never released individually; the whole pool is dropped (or
     cleared) when the run ends.
    */

    vector<SearchNode> nodes;

    NodePool();

    ptrSearchNode new_SearchNode(Coordinate state, ptrSearchNode parent, Action action);

    SearchNode &operator[](ptrSearchNode node);
    const SearchNode &operator[](ptrSearchNode node) const;

    int size() const;
    void clear();
};
