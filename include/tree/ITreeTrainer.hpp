#pragma once

#include <memory>
#include <string>
#include <vector>
#include "Node.hpp"
#include "Sample.hpp"

class ITreeTrainer {
public:
    virtual ~ITreeTrainer() = default;

    virtual void train(const Sample& sample,
                       const std::vector<std::string>& attributes,
                       const TestGenerator& testGenerator,
                       Label truthLabel) = 0;

    virtual bool predict(const Example& example) const = 0;

    // accuracy: share of examples whose prediction matches (label == truthLabel).
    // f1: F1 score of the positive class, 0 when it has no true positives.
    virtual void evaluate(const Sample& sample,
                          double& accuracy,
                          double& f1) const = 0;

    const Node* getRoot() const { return root_.get(); }

protected:
    std::unique_ptr<Node> root_;
};
