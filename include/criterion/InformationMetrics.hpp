#pragma once

#include "tree/Sample.hpp"
#include <cstddef>
#include <utility>

// Binary Shannon entropy (bits) of a positive/negative count pair.
// Returns 0 when either count is 0.
double info(std::size_t positive, std::size_t negative);

// Size-weighted entropy of the two partitions induced by attributeTest.
// Throws EmptySampleError on an empty sample.
double entropy(const Sample& sample,
               const AttributeTest& attributeTest,
               Label truthLabel);

// info(whole sample) - entropy(split). Throws EmptySampleError on an empty sample.
double gain(const Sample& sample,
            const AttributeTest& attributeTest,
            Label truthLabel);

// (positive, negative): positive = labels equal to truthLabel, negative =
// everything else. Labels other than the two expected values therefore count
// as negative.
std::pair<std::size_t, std::size_t>
countByLabel(const Sample& sample, Label truthLabel);
