#pragma once

#include "tree/Sample.hpp"
#include <string>
#include <unordered_map>
#include <vector>

using ThresholdMap = std::unordered_map<std::string, double>;

// attr -> (example[attr] != 0). Missing attributes throw std::out_of_range.
TestGenerator makeBooleanTestGenerator();

// attr -> (example[attr] > thresholds[attr]). The generator itself throws
// std::out_of_range for an attribute without a threshold.
TestGenerator makeThresholdTestGenerator(ThresholdMap thresholds);

// Same threshold for every attribute
TestGenerator makeUniformThresholdTestGenerator(double threshold);

// Per-attribute mean / median of the sample's values
ThresholdMap meanThresholds(const Sample& sample,
                            const std::vector<std::string>& attributes);

ThresholdMap medianThresholds(const Sample& sample,
                              const std::vector<std::string>& attributes);
