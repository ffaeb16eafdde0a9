#include <gtest/gtest.h>
#include "finder/TestGenerators.hpp"
#include "app/ID3App.hpp"
#include "tree/TreeErrors.hpp"

#include <stdexcept>

namespace {

Sample column(const std::vector<double>& values) {
    Sample s;
    for (double v : values) s.push_back({Example{{"x", v}}, 0});
    return s;
}

} // namespace

TEST(TestGeneratorsTest, BooleanTest) {
    auto test = makeBooleanTestGenerator()("x");
    EXPECT_TRUE(test(Example{{"x", 1.0}}));
    EXPECT_TRUE(test(Example{{"x", -2.0}}));
    EXPECT_FALSE(test(Example{{"x", 0.0}}));
    EXPECT_THROW(test(Example{{"y", 1.0}}), std::out_of_range);
}

TEST(TestGeneratorsTest, ThresholdTest) {
    auto gen = makeThresholdTestGenerator({{"x", 2.0}});
    auto test = gen("x");
    EXPECT_TRUE(test(Example{{"x", 2.5}}));
    EXPECT_FALSE(test(Example{{"x", 2.0}}));
    EXPECT_THROW(gen("unknown"), std::out_of_range);
}

TEST(TestGeneratorsTest, UniformThreshold) {
    auto gen = makeUniformThresholdTestGenerator(0.5);
    EXPECT_TRUE(gen("x")(Example{{"x", 0.75}}));
    EXPECT_FALSE(gen("y")(Example{{"y", 0.5}}));
}

TEST(TestGeneratorsTest, MeanAndMedianThresholds) {
    const Sample s = column({4.0, 1.0, 3.0, 2.0});
    EXPECT_DOUBLE_EQ(meanThresholds(s, {"x"}).at("x"), 2.5);
    EXPECT_DOUBLE_EQ(medianThresholds(s, {"x"}).at("x"), 2.0);

    const Sample odd = column({5.0, 1.0, 3.0});
    EXPECT_DOUBLE_EQ(medianThresholds(odd, {"x"}).at("x"), 3.0);

    EXPECT_THROW(meanThresholds(Sample{}, {"x"}), EmptySampleError);
    EXPECT_THROW(medianThresholds(Sample{}, {"x"}), EmptySampleError);
}

TEST(CreateTestGeneratorTest, KnownMethods) {
    const Sample s = column({0.0, 1.0, 2.0, 3.0});
    const std::vector<std::string> attrs = {"x"};

    EXPECT_TRUE(createTestGenerator("boolean", s, attrs)("x")(Example{{"x", 3.0}}));
    EXPECT_TRUE(createTestGenerator("mean", s, attrs)("x")(Example{{"x", 2.0}}));
    EXPECT_FALSE(createTestGenerator("median", s, attrs)("x")(Example{{"x", 1.0}}));
    EXPECT_TRUE(createTestGenerator("threshold:0.5", s, attrs)("x")(Example{{"x", 1.0}}));
    EXPECT_FALSE(createTestGenerator("threshold:0.5", s, attrs)("x")(Example{{"x", 0.5}}));
}

TEST(CreateTestGeneratorTest, UnknownMethodThrows) {
    EXPECT_THROW(createTestGenerator("gini", column({1.0}), {"x"}), std::invalid_argument);
}
