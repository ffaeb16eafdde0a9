#include <gtest/gtest.h>
#include "tree/trainer/TreeBuilder.hpp"
#include "finder/TestGenerators.hpp"
#include "tree/TreeErrors.hpp"

#include <atomic>
#include <limits>
#include <memory>
#include <random>
#include <sstream>
#include <stdexcept>

namespace {

LabeledExample row(double a, double b, Label label) {
    return {Example{{"a", a}, {"b", b}}, label};
}

// Attribute ids of the form "x>2.5" test x against the embedded threshold
TestGenerator thresholdIdGenerator() {
    return [](const std::string& id) -> AttributeTest {
        const auto pos = id.find('>');
        const std::string attr = id.substr(0, pos);
        const double thr = std::stod(id.substr(pos + 1));
        return [attr, thr](const Example& ex) { return ex.at(attr) > thr; };
    };
}

Example bits(int value, int width) {
    Example ex;
    for (int f = 0; f < width; ++f) {
        ex["x" + std::to_string(f)] = static_cast<double>((value >> f) & 1);
    }
    return ex;
}

std::vector<std::string> bitNames(int width) {
    std::vector<std::string> names;
    for (int f = 0; f < width; ++f) names.push_back("x" + std::to_string(f));
    return names;
}

// Boolean generator that records whether two calls ever overlapped
struct OverlapCheckingGenerator {
    std::shared_ptr<std::atomic<int>>  inFlight   = std::make_shared<std::atomic<int>>(0);
    std::shared_ptr<std::atomic<bool>> overlapped = std::make_shared<std::atomic<bool>>(false);
    std::shared_ptr<std::atomic<int>>  calls      = std::make_shared<std::atomic<int>>(0);

    AttributeTest operator()(const std::string& attr) const {
        if (inFlight->fetch_add(1) != 0) overlapped->store(true);
        calls->fetch_add(1);
        AttributeTest test = makeBooleanTestGenerator()(attr);
        inFlight->fetch_sub(1);
        return test;
    }
};

std::string dump(const Node& root) {
    std::ostringstream os;
    printTree(root, os);
    return os.str();
}

} // namespace

// ─── Induction ────────────────────────────────────────────────

TEST(TreeBuilderTest, ConcreteScenario) {
    Sample s = {row(1, 1, 1), row(1, 0, 1), row(0, 1, 0), row(0, 0, 0)};
    auto root = buildTree(s, {"a", "b"}, makeBooleanTestGenerator(), 1);

    ASSERT_NE(root, nullptr);
    EXPECT_EQ(root->attr, "a");
    ASSERT_TRUE(Node::isLeaf(root->trueChild));
    ASSERT_TRUE(Node::isLeaf(root->falseChild));
    EXPECT_TRUE(Node::verdict(root->trueChild));
    EXPECT_FALSE(Node::verdict(root->falseChild));

    EXPECT_TRUE(predict(*root, Example{{"a", 1.0}, {"b", 0.0}}));
    EXPECT_FALSE(predict(*root, Example{{"a", 0.0}, {"b", 1.0}}));
}

TEST(TreeBuilderTest, LearnsXorThroughZeroGainRoot) {
    Sample s = {row(1, 1, 0), row(1, 0, 1), row(0, 1, 1), row(0, 0, 0)};
    auto root = buildTree(s, {"a", "b"}, makeBooleanTestGenerator(), 1);

    EXPECT_EQ(root->attr, "a");
    const Node* t = Node::subtree(root->trueChild);
    const Node* f = Node::subtree(root->falseChild);
    ASSERT_NE(t, nullptr);
    ASSERT_NE(f, nullptr);
    EXPECT_EQ(t->attr, "b");
    EXPECT_EQ(f->attr, "b");

    for (const auto& le : s) {
        EXPECT_EQ(predict(*root, le.first), le.second == 1);
    }

    const TreeStats stats = computeTreeStats(*root);
    EXPECT_EQ(stats.depth, 2);
    EXPECT_EQ(stats.internalNodes, 3);
    EXPECT_EQ(stats.leaves, 4);
}

TEST(TreeBuilderTest, ReusesAttributeWithAnotherThreshold) {
    Sample s;
    const Label labels[] = {0, 1, 1, 0};
    for (int x = 1; x <= 4; ++x) {
        s.push_back({Example{{"x", static_cast<double>(x)}}, labels[x - 1]});
    }

    auto root = buildTree(s, {"x>1.5", "x>2.5", "x>3.5"}, thresholdIdGenerator(), 1);

    EXPECT_EQ(root->attr, "x>1.5");
    ASSERT_TRUE(Node::isLeaf(root->falseChild));
    EXPECT_FALSE(Node::verdict(root->falseChild));

    const Node* inner = Node::subtree(root->trueChild);
    ASSERT_NE(inner, nullptr);
    EXPECT_EQ(inner->attr, "x>3.5");

    EXPECT_EQ(dump(*root),
              "[x>1.5]\n"
              "  T:\n"
              "    [x>3.5]\n"
              "      T: -> false\n"
              "      F: -> true\n"
              "  F: -> false\n");

    for (const auto& le : s) {
        EXPECT_EQ(predict(*root, le.first), le.second == 1);
    }
}

TEST(TreeBuilderTest, HeterogeneousLabelsCountAsNegative) {
    Sample s = {row(1, 0, 1), row(0, 1, 2), row(0, 0, 3)};
    auto root = buildTree(s, {"a", "b"}, makeBooleanTestGenerator(), 1);
    EXPECT_EQ(root->attr, "a");
    EXPECT_TRUE(predict(*root, s[0].first));
    EXPECT_FALSE(predict(*root, s[1].first));
    EXPECT_FALSE(predict(*root, s[2].first));
}

TEST(TreeBuilderTest, FitsTrainingSet) {
    std::mt19937 gen(7);
    std::bernoulli_distribution coin(0.4);

    // All 64 distinct examples, so the data is always separable
    Sample s;
    for (int v = 0; v < 64; ++v) {
        s.push_back({bits(v, 6), coin(gen) ? 1 : 0});
    }

    auto root = buildTree(s, bitNames(6), makeBooleanTestGenerator(), 1);
    for (const auto& le : s) {
        const bool first = predict(*root, le.first);
        EXPECT_EQ(first, le.second == 1);
        EXPECT_EQ(predict(*root, le.first), first);
    }
}

TEST(TreeBuilderTest, ParallelBuildMatchesSerial) {
    Sample s;
    for (int v = 0; v < 2048; ++v) {
        Example ex = bits(v, 11);
        const bool label = (ex["x0"] != 0.0 && ex["x3"] != 0.0) ||
                           ((ex["x5"] != 0.0) != (ex["x7"] != 0.0));
        s.push_back({std::move(ex), label ? 1 : 0});
    }
    const auto attrs = bitNames(11);
    auto gen = makeBooleanTestGenerator();

    TreeBuildOptions serialOpts;
    serialOpts.parallelThreshold = std::numeric_limits<std::size_t>::max();
    TreeBuildOptions parallelOpts;
    parallelOpts.parallelThreshold = 10;

    auto serial   = buildTree(s, attrs, gen, 1, serialOpts);
    auto parallel = buildTree(s, attrs, gen, 1, parallelOpts);

    EXPECT_EQ(dump(*serial), dump(*parallel));
    for (const auto& le : s) {
        EXPECT_EQ(predict(*parallel, le.first), le.second == 1);
    }
}

TEST(TreeBuilderTest, DefaultOptionsNeverReenterGenerator) {
    // Large enough to cross every parallel gate if the defaults enabled one
    Sample s;
    for (int v = 0; v < 4096; ++v) {
        Example ex = bits(v, 12);
        const bool label = (ex["x0"] != 0.0) != (ex["x1"] != 0.0);
        s.push_back({std::move(ex), label ? 1 : 0});
    }

    OverlapCheckingGenerator checker;
    auto root = buildTree(s, bitNames(12), TestGenerator(checker), 1);

    EXPECT_GT(checker.calls->load(), 0);
    EXPECT_FALSE(checker.overlapped->load());
    for (const auto& le : s) {
        EXPECT_EQ(predict(*root, le.first), le.second == 1);
    }
}

// ─── Boundaries ───────────────────────────────────────────────

TEST(TreeBuilderTest, SingleExampleBecomesLeaves) {
    Sample s = {row(1, 0, 0)};
    auto root = buildTree(s, {"a", "b"}, makeBooleanTestGenerator(), 1);

    EXPECT_EQ(root->attr, "a");
    ASSERT_TRUE(Node::isLeaf(root->trueChild));
    ASSERT_TRUE(Node::isLeaf(root->falseChild));
    EXPECT_FALSE(Node::verdict(root->trueChild));
    EXPECT_FALSE(Node::verdict(root->falseChild));
}

TEST(TreeBuilderTest, PureSampleGivesUniformVerdict) {
    Sample s = {row(1, 1, 1), row(1, 0, 1), row(0, 1, 1)};
    auto root = buildTree(s, {"a", "b"}, makeBooleanTestGenerator(), 1);
    EXPECT_EQ(root->attr, "a");
    EXPECT_TRUE(Node::isLeaf(root->trueChild));
    EXPECT_TRUE(Node::isLeaf(root->falseChild));
    EXPECT_TRUE(predict(*root, Example{{"a", 0.0}, {"b", 0.0}}));
}

TEST(TreeBuilderTest, SkipsAttributesThatDoNotSplit) {
    // XOR of a and b: every gain is 0, and the constant "c" would win the
    // tie without making progress
    Sample s;
    for (const auto& le : {row(1, 1, 0), row(1, 0, 1), row(0, 1, 1), row(0, 0, 0)}) {
        Example ex = le.first;
        ex["c"] = 1.0;
        s.push_back({ex, le.second});
    }
    auto root = buildTree(s, {"c", "a", "b"}, makeBooleanTestGenerator(), 1);
    EXPECT_EQ(root->attr, "a");
    for (const auto& le : s) {
        EXPECT_EQ(predict(*root, le.first), le.second == 1);
    }
}

// ─── Errors ───────────────────────────────────────────────────

TEST(TreeBuilderTest, ConflictingDuplicatesDoNotConverge) {
    Sample s = {row(1, 0, 1), row(1, 0, 0), row(0, 1, 0)};
    EXPECT_THROW(buildTree(s, {"a", "b"}, makeBooleanTestGenerator(), 1),
                 TreeDidNotConvergeError);
}

TEST(TreeBuilderTest, MaxDepthGuard) {
    Sample s = {row(1, 1, 0), row(1, 0, 1), row(0, 1, 1), row(0, 0, 0)};
    TreeBuildOptions opts;
    opts.maxDepth = 1;
    EXPECT_THROW(buildTree(s, {"a", "b"}, makeBooleanTestGenerator(), 1, opts),
                 TreeDidNotConvergeError);

    opts.maxDepth = 2;
    EXPECT_NO_THROW(buildTree(s, {"a", "b"}, makeBooleanTestGenerator(), 1, opts));

    opts.maxDepth = 0;
    EXPECT_THROW(buildTree(s, {"a", "b"}, makeBooleanTestGenerator(), 1, opts),
                 std::invalid_argument);
}

TEST(TreeBuilderTest, EmptyInputsThrow) {
    Sample s = {row(1, 0, 1)};
    EXPECT_THROW(buildTree(Sample{}, {"a"}, makeBooleanTestGenerator(), 1), EmptySampleError);
    EXPECT_THROW(buildTree(s, {}, makeBooleanTestGenerator(), 1), NoAttributesError);
}
