#include "finder/AttributePartitioner.hpp"

std::pair<Sample, Sample>
partitionByTest(const Sample& sample, const AttributeTest& attributeTest) {
    Sample trueSample;
    Sample falseSample;
    trueSample.reserve(sample.size());
    falseSample.reserve(sample.size());

    for (const auto& labeled : sample) {
        if (attributeTest(labeled.first)) {
            trueSample.push_back(labeled);
        } else {
            falseSample.push_back(labeled);
        }
    }
    return {std::move(trueSample), std::move(falseSample)};
}

bool splitsSample(const Sample& sample, const AttributeTest& attributeTest) {
    bool seenTrue = false;
    bool seenFalse = false;
    for (const auto& labeled : sample) {
        if (attributeTest(labeled.first)) {
            seenTrue = true;
        } else {
            seenFalse = true;
        }
        if (seenTrue && seenFalse) return true;
    }
    return false;
}
