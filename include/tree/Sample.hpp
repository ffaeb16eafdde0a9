#pragma once

#include <functional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

// Attribute name -> value. Boolean attributes are stored as 0.0 / 1.0.
using Example = std::unordered_map<std::string, double>;
using Label   = int;

using LabeledExample = std::pair<Example, Label>;
using Sample         = std::vector<LabeledExample>;

// Binary split over an example, produced per attribute by a TestGenerator
using AttributeTest = std::function<bool(const Example&)>;
using TestGenerator = std::function<AttributeTest(const std::string&)>;
