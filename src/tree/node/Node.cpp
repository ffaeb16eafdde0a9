// src/tree/node/Node.cpp
#include "tree/Node.hpp"
#include <algorithm>
#include <stdexcept>

bool Node::predict(const Example& example) const {
    return ::predict(*this, example);
}

bool predict(const Node& root, const Example& example) {
    const Node* cur = &root;
    while (true) {
        const Child& next = cur->childFor(cur->attrTest(example));
        if (Node::isLeaf(next)) {
            return Node::verdict(next);
        }
        cur = Node::subtree(next);
        if (!cur) {
            throw std::logic_error("predict: empty subtree slot");
        }
    }
}

namespace {

void accumulateStats(const Node* node, int currentDepth, TreeStats& stats) {
    stats.internalNodes++;
    stats.depth = std::max(stats.depth, currentDepth);

    for (const Child* c : {&node->trueChild, &node->falseChild}) {
        if (Node::isLeaf(*c)) {
            stats.leaves++;
        } else if (const Node* sub = Node::subtree(*c)) {
            accumulateStats(sub, currentDepth + 1, stats);
        }
    }
}

void printChild(const Child& c, const char* branch, int indent, std::ostream& os);

void printNode(const Node& node, int indent, std::ostream& os) {
    os << std::string(indent * 2, ' ') << "[" << node.attr << "]\n";
    printChild(node.trueChild, "T", indent + 1, os);
    printChild(node.falseChild, "F", indent + 1, os);
}

void printChild(const Child& c, const char* branch, int indent, std::ostream& os) {
    os << std::string(indent * 2, ' ') << branch << ":";
    if (Node::isLeaf(c)) {
        os << " -> " << (Node::verdict(c) ? "true" : "false") << "\n";
        return;
    }
    os << "\n";
    if (const Node* sub = Node::subtree(c)) {
        printNode(*sub, indent + 1, os);
    }
}

} // namespace

TreeStats computeTreeStats(const Node& root) {
    TreeStats stats;
    accumulateStats(&root, 1, stats);
    return stats;
}

void printTree(const Node& root, std::ostream& os) {
    printNode(root, 0, os);
}
