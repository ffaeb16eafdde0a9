// =============================================================================
// src/tree/trainer/ID3TreeTrainer.cpp
// =============================================================================
#include "tree/trainer/ID3TreeTrainer.hpp"
#include "tree/TreeErrors.hpp"
#include <chrono>      // For timing
#include <exception>
#include <iostream>    // For std::cout
#include <stdexcept>
#ifdef _OPENMP
#include <omp.h>
#endif

ID3TreeTrainer::ID3TreeTrainer(TreeBuildOptions options, bool verbose)
    : options_(options),
      verbose_(verbose)
{}

void ID3TreeTrainer::train(const Sample& sample,
                           const std::vector<std::string>& attributes,
                           const TestGenerator& testGenerator,
                           Label truthLabel) {
    auto trainStart = std::chrono::high_resolution_clock::now();

    if (verbose_) {
        #ifdef _OPENMP
        std::cout << "Using " << omp_get_max_threads()
                  << " OpenMP threads (controlled by OMP_NUM_THREADS)" << std::endl;
        #endif
        std::cout << "Training on " << sample.size() << " examples, "
                  << attributes.size() << " candidate attributes, truth label "
                  << truthLabel << std::endl;
    }

    // Keep the previous tree if induction throws
    auto root = buildTree(sample, attributes, testGenerator, truthLabel, options_);
    root_ = std::move(root);
    truthLabel_ = truthLabel;

    auto trainEnd = std::chrono::high_resolution_clock::now();
    auto trainTime = std::chrono::duration_cast<std::chrono::milliseconds>(trainEnd - trainStart);

    if (verbose_) {
        const TreeStats stats = computeTreeStats(*root_);
        std::cout << "Tree training completed:" << std::endl;
        std::cout << "  Depth: " << stats.depth
                  << " | Nodes: " << stats.internalNodes
                  << " | Leaves: " << stats.leaves << std::endl;
        std::cout << "  Build time: " << trainTime.count() << "ms" << std::endl;
    }
}

const Node& ID3TreeTrainer::requireRoot() const {
    if (!root_) {
        throw std::logic_error("ID3TreeTrainer: predict called before train");
    }
    return *root_;
}

bool ID3TreeTrainer::predict(const Example& example) const {
    return ::predict(requireRoot(), example);
}

std::vector<bool> ID3TreeTrainer::predictBatch(const Sample& sample) const {
    const Node& root = requireRoot();
    const long long n = static_cast<long long>(sample.size());

    // std::vector<bool> is bit-packed, write through a byte buffer instead
    std::vector<unsigned char> buffer(sample.size(), 0);

    std::exception_ptr error;

    #pragma omp parallel for schedule(static, 256) if(n > 1000)
    for (long long i = 0; i < n; ++i) {
        try {
            buffer[i] = ::predict(root, sample[i].first) ? 1 : 0;
        } catch (...) {
            #pragma omp critical(id3_predict_error)
            if (!error) error = std::current_exception();
        }
    }
    if (error) std::rethrow_exception(error);

    return std::vector<bool>(buffer.begin(), buffer.end());
}

void ID3TreeTrainer::evaluate(const Sample& sample,
                              double& accuracy,
                              double& f1) const {
    if (sample.empty()) throw EmptySampleError("evaluate");

    const Node& root = requireRoot();
    const long long n = static_cast<long long>(sample.size());

    long long correct = 0, truePos = 0, falsePos = 0, falseNeg = 0;
    std::exception_ptr error;

    #pragma omp parallel for reduction(+:correct,truePos,falsePos,falseNeg) schedule(static, 256) if(n > 1000)
    for (long long i = 0; i < n; ++i) {
        bool predicted = false;
        try {
            predicted = ::predict(root, sample[i].first);
        } catch (...) {
            #pragma omp critical(id3_predict_error)
            if (!error) error = std::current_exception();
            continue;
        }
        const bool actual = sample[i].second == truthLabel_;
        if (predicted == actual) ++correct;
        if (predicted && actual) ++truePos;
        if (predicted && !actual) ++falsePos;
        if (!predicted && actual) ++falseNeg;
    }
    if (error) std::rethrow_exception(error);

    accuracy = static_cast<double>(correct) / static_cast<double>(n);
    f1 = truePos == 0
        ? 0.0
        : 2.0 * truePos / static_cast<double>(2 * truePos + falsePos + falseNeg);
}
