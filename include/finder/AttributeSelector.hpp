#pragma once

#include "tree/Sample.hpp"
#include <cstddef>
#include <limits>
#include <string>
#include <vector>

// Gain of every candidate, in the order of attributes. Candidates are
// evaluated with OpenMP when attributes.size() * sample.size() exceeds
// parallelThreshold, and testGenerator must then be safe to call
// concurrently. The default keeps every call on the calling thread.
std::vector<double>
attributeGains(const Sample& sample,
               const std::vector<std::string>& attributes,
               const TestGenerator& testGenerator,
               Label truthLabel,
               std::size_t parallelThreshold = std::numeric_limits<std::size_t>::max());

// Attribute with maximal gain. Ties keep the attribute that comes first in
// attributes, so callers must pass a stable order for reproducible trees.
// Throws NoAttributesError / EmptySampleError on empty inputs.
std::string
pickBestAttribute(const Sample& sample,
                  const std::vector<std::string>& attributes,
                  const TestGenerator& testGenerator,
                  Label truthLabel,
                  std::size_t parallelThreshold = std::numeric_limits<std::size_t>::max());
