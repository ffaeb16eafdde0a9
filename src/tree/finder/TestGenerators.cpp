#include "finder/TestGenerators.hpp"
#include "tree/TreeErrors.hpp"
#include <algorithm>
#include <memory>

TestGenerator makeBooleanTestGenerator() {
    return [](const std::string& attr) -> AttributeTest {
        return [attr](const Example& ex) { return ex.at(attr) != 0.0; };
    };
}

TestGenerator makeThresholdTestGenerator(ThresholdMap thresholds) {
    auto shared = std::make_shared<const ThresholdMap>(std::move(thresholds));
    return [shared](const std::string& attr) -> AttributeTest {
        const double thr = shared->at(attr);
        return [attr, thr](const Example& ex) { return ex.at(attr) > thr; };
    };
}

TestGenerator makeUniformThresholdTestGenerator(double threshold) {
    return [threshold](const std::string& attr) -> AttributeTest {
        return [attr, threshold](const Example& ex) { return ex.at(attr) > threshold; };
    };
}

ThresholdMap meanThresholds(const Sample& sample,
                            const std::vector<std::string>& attributes) {
    if (sample.empty()) throw EmptySampleError("meanThresholds");

    ThresholdMap out;
    for (const auto& attr : attributes) {
        double sum = 0.0;
        for (const auto& labeled : sample) {
            sum += labeled.first.at(attr);
        }
        out[attr] = sum / static_cast<double>(sample.size());
    }
    return out;
}

ThresholdMap medianThresholds(const Sample& sample,
                              const std::vector<std::string>& attributes) {
    if (sample.empty()) throw EmptySampleError("medianThresholds");

    ThresholdMap out;
    std::vector<double> vals;
    vals.reserve(sample.size());

    for (const auto& attr : attributes) {
        vals.clear();
        for (const auto& labeled : sample) {
            vals.push_back(labeled.first.at(attr));
        }
        // Lower median
        const size_t mid = (vals.size() - 1) / 2;
        std::nth_element(vals.begin(), vals.begin() + mid, vals.end());
        out[attr] = vals[mid];
    }
    return out;
}
