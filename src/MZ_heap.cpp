#include "MZ_heap.hpp"
#include "common.hpp"
#include "rassert.hpp"

// -----------------------------------------------------------------------------
// Handle Implementation (ptrSearchNode)
// -----------------------------------------------------------------------------

ptrSearchNode::ptrSearchNode() {
    ind = -1; // Represents NULL/Invalid handle
}

ptrSearchNode::ptrSearchNode(int i) {
    ind = i;
}

bool ptrSearchNode::operator==(ptrSearchNode other) const {
    return ind == other.ind;
}

bool ptrSearchNode::operator!=(ptrSearchNode other) const {
    return ind != other.ind;
}

// -----------------------------------------------------------------------------
// SearchNode
// -----------------------------------------------------------------------------

SearchNode::SearchNode() : state(), parent(NULL_Node), action(ACTION_NONE) {}

SearchNode::SearchNode(Coordinate state, ptrSearchNode parent, Action action)
    : state(state), parent(parent), action(action) {}

// -----------------------------------------------------------------------------
// Node Arena (NodePool) Implementation
// -----------------------------------------------------------------------------

NodePool::NodePool() {
    // Reserve up front; push_back doubles the capacity afterwards.
    nodes.reserve(INITIAL_POOL_SIZE);
}

ptrSearchNode NodePool::new_SearchNode(Coordinate state, ptrSearchNode parent, Action action) {
    /*
     Appends a node and returns its handle.
     The parent must already live in this pool (or be NULL_Node for the root).
    */
    rassert(parent == NULL_Node || (parent.ind >= 0 && parent.ind < size()),
            "Parent handle does not belong to this pool!");

    nodes.push_back(SearchNode(state, parent, action));
    return ptrSearchNode(size() - 1);
}

SearchNode &NodePool::operator[](ptrSearchNode node) {
    rassert(node.ind >= 0 && node.ind < size(), "Node handle out of range!");
    return nodes[node.ind];
}

const SearchNode &NodePool::operator[](ptrSearchNode node) const {
    rassert(node.ind >= 0 && node.ind < size(), "Node handle out of range!");
    return nodes[node.ind];
}

int NodePool::size() const {
    return (int)nodes.size();
}

void NodePool::clear() {
    nodes.clear();
}
