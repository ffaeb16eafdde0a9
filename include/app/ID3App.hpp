#pragma once

#include "tree/Sample.hpp"
#include <cstddef>
#include <string>
#include <vector>

struct ProgramOptions {
    std::string dataPath   = "../data/sample_dataset.csv";
    std::string testMethod = "boolean";   // boolean | mean | median | threshold:<t>
    Label       truthLabel = 1;
    double      trainRatio = 1.0;         // 1.0 evaluates on the training set
    int         maxDepth   = 800;
    std::size_t parallelThreshold = 1000; // built-in generators are reentrant
    std::string outputPath;               // empty: no predictions file
    bool        verbose    = true;
};

// Builds the caller-side test generator named by method; mean/median
// thresholds are taken from trainSample. Throws std::invalid_argument for an
// unknown method.
TestGenerator createTestGenerator(const std::string& method,
                                  const Sample& trainSample,
                                  const std::vector<std::string>& attributes);

void runID3App(const ProgramOptions& opts);
