#pragma once

#include "tree/Sample.hpp"
#include <memory>
#include <cstddef>
#include <ostream>
#include <string>
#include <variant>

struct Node;

// A child slot holds either a leaf verdict or an owned subtree
using Child = std::variant<bool, std::unique_ptr<Node>>;

struct Node {
    std::string   attr;        // attribute tested here (introspection only)
    AttributeTest attrTest;
    Child         trueChild  = false;
    Child         falseChild = false;

    Node(std::string attribute, AttributeTest test)
        : attr(std::move(attribute)), attrTest(std::move(test)) {}

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    // Accessor methods
    const Child& childFor(bool testResult) const {
        return testResult ? trueChild : falseChild;
    }

    static bool isLeaf(const Child& c) { return std::holds_alternative<bool>(c); }
    static bool verdict(const Child& c) { return std::get<bool>(c); }

    static const Node* subtree(const Child& c) {
        const auto* p = std::get_if<std::unique_ptr<Node>>(&c);
        return p ? p->get() : nullptr;
    }

    bool predict(const Example& example) const;
};

struct TreeStats {
    int depth         = 0;   // internal levels on the longest path
    int internalNodes = 0;
    int leaves        = 0;
};

// Walks the tree from the root and returns the first leaf verdict reached
bool predict(const Node& root, const Example& example);

TreeStats computeTreeStats(const Node& root);

void printTree(const Node& root, std::ostream& os);
