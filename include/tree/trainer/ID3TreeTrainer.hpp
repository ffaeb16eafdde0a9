#pragma once

#include "../ITreeTrainer.hpp"
#include "TreeBuilder.hpp"
#include <vector>

class ID3TreeTrainer : public ITreeTrainer {
public:
    explicit ID3TreeTrainer(TreeBuildOptions options = {}, bool verbose = true);

    void train(const Sample& sample,
               const std::vector<std::string>& attributes,
               const TestGenerator& testGenerator,
               Label truthLabel) override;

    // Throws std::logic_error before train() has succeeded
    bool predict(const Example& example) const override;

    std::vector<bool> predictBatch(const Sample& sample) const;

    void evaluate(const Sample& sample,
                  double& accuracy,
                  double& f1) const override;

    Label truthLabel() const { return truthLabel_; }

private:
    const Node& requireRoot() const;

    TreeBuildOptions options_;
    bool  verbose_;
    Label truthLabel_ = 1;
};
