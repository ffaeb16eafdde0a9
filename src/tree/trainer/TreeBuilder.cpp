// =============================================================================
// src/tree/trainer/TreeBuilder.cpp - Recursive ID3 induction
// =============================================================================
#include "tree/trainer/TreeBuilder.hpp"
#include "criterion/InformationMetrics.hpp"
#include "finder/AttributePartitioner.hpp"
#include "finder/AttributeSelector.hpp"
#include "tree/TreeErrors.hpp"
#include <exception>
#include <stdexcept>
#include <tuple>
#ifdef _OPENMP
#include <omp.h>
#endif

namespace {

struct BuildContext {
    const std::vector<std::string>& attributes;
    const TestGenerator&            testGenerator;
    Label                           truthLabel;
    const TreeBuildOptions&         options;
};

bool isPure(const Sample& sample, Label truthLabel) {
    auto [p, n] = countByLabel(sample, truthLabel);
    return info(p, n) == 0.0;
}

// Ties go to the positive verdict
bool majorityVerdict(const Sample& sample, Label truthLabel) {
    auto [p, n] = countByLabel(sample, truthLabel);
    return p >= n;
}

std::unique_ptr<Node> buildNode(const Sample& sample,
                                const BuildContext& ctx,
                                int depth);

Child buildChild(const Sample& part,
                 const Sample& parent,
                 const AttributeTest& parentTest,
                 const BuildContext& ctx,
                 int depth) {
    // Only reachable when the parent itself was pure and unsplittable
    if (part.empty()) {
        return Child(majorityVerdict(parent, ctx.truthLabel));
    }
    if (entropy(part, parentTest, ctx.truthLabel) == 0.0) {
        return Child(part.front().second == ctx.truthLabel);
    }
    return Child(buildNode(part, ctx, depth + 1));
}

std::unique_ptr<Node> buildNode(const Sample& sample,
                                const BuildContext& ctx,
                                int depth) {
    if (depth >= ctx.options.maxDepth) {
        throw TreeDidNotConvergeError("maximum depth " +
                                      std::to_string(ctx.options.maxDepth) +
                                      " reached");
    }

    // Candidates that cannot split this partition would recurse on the
    // same sample forever
    std::vector<std::string> candidates;
    candidates.reserve(ctx.attributes.size());
    for (const auto& attr : ctx.attributes) {
        if (splitsSample(sample, ctx.testGenerator(attr))) {
            candidates.push_back(attr);
        }
    }

    std::string rootAttr;
    if (candidates.empty()) {
        if (!isPure(sample, ctx.truthLabel)) {
            throw TreeDidNotConvergeError(
                "no attribute separates " + std::to_string(sample.size()) +
                " remaining examples with mixed labels");
        }
        rootAttr = ctx.attributes.front();
    } else {
        rootAttr = pickBestAttribute(sample, candidates, ctx.testGenerator,
                                     ctx.truthLabel, ctx.options.parallelThreshold);
    }

    auto node = std::make_unique<Node>(rootAttr, ctx.testGenerator(rootAttr));

    Sample trueSample, falseSample;
    std::tie(trueSample, falseSample) = partitionByTest(sample, node->attrTest);

    // Parallel recursion only for large siblings near the root
    const bool useParallelRecursion = depth <= 2 &&
        trueSample.size()  > ctx.options.parallelThreshold &&
        falseSample.size() > ctx.options.parallelThreshold;

    if (useParallelRecursion) {
        std::exception_ptr trueError;
        std::exception_ptr falseError;

        #pragma omp parallel sections num_threads(2)
        {
            #pragma omp section
            {
                try {
                    node->trueChild = buildChild(trueSample, sample, node->attrTest, ctx, depth);
                } catch (...) {
                    trueError = std::current_exception();
                }
            }
            #pragma omp section
            {
                try {
                    node->falseChild = buildChild(falseSample, sample, node->attrTest, ctx, depth);
                } catch (...) {
                    falseError = std::current_exception();
                }
            }
        }

        if (trueError) std::rethrow_exception(trueError);
        if (falseError) std::rethrow_exception(falseError);
    } else {
        node->trueChild  = buildChild(trueSample, sample, node->attrTest, ctx, depth);
        node->falseChild = buildChild(falseSample, sample, node->attrTest, ctx, depth);
    }

    return node;
}

} // namespace

std::unique_ptr<Node>
buildTree(const Sample& sample,
          const std::vector<std::string>& attributes,
          const TestGenerator& testGenerator,
          Label truthLabel,
          const TreeBuildOptions& options) {
    if (sample.empty()) throw EmptySampleError("buildTree");
    if (attributes.empty()) throw NoAttributesError("buildTree");
    if (options.maxDepth <= 0) {
        throw std::invalid_argument("buildTree: maxDepth must be positive");
    }

    const BuildContext ctx{attributes, testGenerator, truthLabel, options};
    return buildNode(sample, ctx, 0);
}
