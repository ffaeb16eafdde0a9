#pragma once

#include "tree/Node.hpp"
#include "tree/Sample.hpp"
#include <cstddef>
#include <limits>
#include <memory>
#include <string>
#include <vector>

struct TreeBuildOptions {
    int         maxDepth          = 800;    // exceeding it throws TreeDidNotConvergeError
    // OpenMP gate for selection and recursion. Off by default; enabling it
    // calls the test generator and its tests from several threads at once
    std::size_t parallelThreshold = std::numeric_limits<std::size_t>::max();
};

// Greedy top-down ID3 induction. Every node selects from the full attribute
// list, skipping candidates whose test does not split the node's partition.
// Branches end as soon as their partition is pure.
//
// Throws EmptySampleError, NoAttributesError, and TreeDidNotConvergeError
// when an impure partition cannot be split by any candidate (for example
// identical examples with conflicting labels) or maxDepth is exceeded.
// With the default options the generator is only ever called from the
// calling thread; a finite parallelThreshold requires it to be reentrant.
std::unique_ptr<Node>
buildTree(const Sample& sample,
          const std::vector<std::string>& attributes,
          const TestGenerator& testGenerator,
          Label truthLabel,
          const TreeBuildOptions& options = {});
