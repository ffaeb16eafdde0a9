#pragma once

#include "tree/Sample.hpp"
#include <utility>

// Stable split of sample into (test true, test false). Every example lands in
// exactly one side, relative order is preserved within each side.
std::pair<Sample, Sample>
partitionByTest(const Sample& sample, const AttributeTest& attributeTest);

// True when attributeTest sends at least one example to each side
bool splitsSample(const Sample& sample, const AttributeTest& attributeTest);
