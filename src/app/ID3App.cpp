#include "app/ID3App.hpp"
#include "tree/trainer/ID3TreeTrainer.hpp"
#include "finder/AttributeSelector.hpp"
#include "finder/TestGenerators.hpp"
#include "functions/io/DataIO.hpp"
#include "pipeline/DataSplit.hpp"

#include <iostream>
#include <chrono>
#include <iomanip>
#include <stdexcept>

TestGenerator createTestGenerator(const std::string& method,
                                  const Sample& trainSample,
                                  const std::vector<std::string>& attributes) {
    if (method == "boolean") {
        return makeBooleanTestGenerator();
    }
    else if (method == "mean") {
        return makeThresholdTestGenerator(meanThresholds(trainSample, attributes));
    }
    else if (method == "median") {
        return makeThresholdTestGenerator(medianThresholds(trainSample, attributes));
    }
    else if (method.find("threshold:") == 0) {
        const double thr = std::stod(method.substr(method.find(':') + 1));
        return makeUniformThresholdTestGenerator(thr);
    }
    throw std::invalid_argument("Unsupported test method: " + method);
}

namespace {

void printExample(const Example& ex,
                  const std::vector<std::string>& attributes,
                  std::ostream& os) {
    os << "{";
    for (size_t i = 0; i < attributes.size(); ++i) {
        if (i) os << ", ";
        os << attributes[i] << "=" << ex.at(attributes[i]);
    }
    os << "}";
}

} // namespace

void runID3App(const ProgramOptions& opts) {
    auto totalStart = std::chrono::high_resolution_clock::now();

    // 1. Read CSV
    DataIO io;
    Dataset data = io.readCSV(opts.dataPath);

    // 2. Split dataset
    DataParams dp;
    if (!splitDataset(data.sample, opts.trainRatio, dp)) {
        throw std::invalid_argument("Cannot split " + std::to_string(data.sample.size()) +
                                    " examples with train ratio " + std::to_string(opts.trainRatio));
    }
    const Sample& evalSample = dp.test.empty() ? dp.train : dp.test;

    // 3. Create test generator
    auto generator = createTestGenerator(opts.testMethod, dp.train, data.attributes);

    // 4. Root gains per attribute
    if (opts.verbose) {
        auto gains = attributeGains(dp.train, data.attributes, generator, opts.truthLabel,
                                    opts.parallelThreshold);
        std::cout << "Root information gain:" << std::endl;
        for (size_t i = 0; i < gains.size(); ++i) {
            std::cout << "  " << std::setw(16) << std::left << data.attributes[i]
                      << std::fixed << std::setprecision(6) << gains[i] << std::endl;
        }
        std::cout.unsetf(std::ios::floatfield);
        std::cout << std::right;
    }

    // 5. Train
    TreeBuildOptions buildOptions;
    buildOptions.maxDepth = opts.maxDepth;
    buildOptions.parallelThreshold = opts.parallelThreshold;
    ID3TreeTrainer trainer(buildOptions, opts.verbose);

    std::cout << "generating tree" << std::endl;
    auto trainStart = std::chrono::high_resolution_clock::now();
    trainer.train(dp.train, data.attributes, generator, opts.truthLabel);
    auto trainEnd = std::chrono::high_resolution_clock::now();

    printTree(*trainer.getRoot(), std::cout);

    // 6. Predict
    const auto predictions = trainer.predictBatch(evalSample);
    for (size_t i = 0; i < evalSample.size(); ++i) {
        printExample(evalSample[i].first, data.attributes, std::cout);
        std::cout << " label=" << evalSample[i].second
                  << " -> " << (predictions[i] ? "true" : "false") << std::endl;
    }

    if (!opts.outputPath.empty()) {
        io.writePredictions(predictions, opts.outputPath);
        std::cout << "Predictions written to " << opts.outputPath << std::endl;
    }

    // 7. Evaluate
    double accuracy, f1;
    trainer.evaluate(evalSample, accuracy, f1);

    auto totalEnd = std::chrono::high_resolution_clock::now();
    auto trainTime = std::chrono::duration_cast<std::chrono::milliseconds>(trainEnd - trainStart);
    auto totalTime = std::chrono::duration_cast<std::chrono::milliseconds>(totalEnd - totalStart);

    std::cout << "Evaluated on " << (dp.test.empty() ? "training" : "test")
              << " set (" << evalSample.size() << " examples) | Tests: " << opts.testMethod
              << std::endl;
    std::cout << "Accuracy: " << std::fixed << std::setprecision(6) << accuracy
              << " | F1: " << f1
              << " | Train: " << trainTime.count() << "ms"
              << " | Total: " << totalTime.count() << "ms" << std::endl;
}
