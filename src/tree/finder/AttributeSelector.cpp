// src/tree/finder/AttributeSelector.cpp
#include "finder/AttributeSelector.hpp"
#include "criterion/InformationMetrics.hpp"
#include "tree/TreeErrors.hpp"
#include <exception>
#ifdef _OPENMP
#include <omp.h>
#endif

std::vector<double>
attributeGains(const Sample& sample,
               const std::vector<std::string>& attributes,
               const TestGenerator& testGenerator,
               Label truthLabel,
               std::size_t parallelThreshold) {
    if (sample.empty()) throw EmptySampleError("attributeGains");

    const long long numAttrs = static_cast<long long>(attributes.size());
    std::vector<double> gains(attributes.size(), 0.0);

    const bool useParallel = attributes.size() > 1 &&
                             attributes.size() * sample.size() > parallelThreshold;

    // Exceptions must not leave the parallel region; keep the first one
    // (lowest index) and rethrow it on this thread
    std::vector<std::exception_ptr> errors(attributes.size());

    #pragma omp parallel for schedule(dynamic) if(useParallel)
    for (long long a = 0; a < numAttrs; ++a) {
        try {
            gains[a] = gain(sample, testGenerator(attributes[a]), truthLabel);
        } catch (...) {
            errors[a] = std::current_exception();
        }
    }

    for (const auto& err : errors) {
        if (err) std::rethrow_exception(err);
    }
    return gains;
}

std::string
pickBestAttribute(const Sample& sample,
                  const std::vector<std::string>& attributes,
                  const TestGenerator& testGenerator,
                  Label truthLabel,
                  std::size_t parallelThreshold) {
    if (attributes.empty()) throw NoAttributesError("pickBestAttribute");
    if (sample.empty()) throw EmptySampleError("pickBestAttribute");

    const auto gains = attributeGains(sample, attributes, testGenerator,
                                      truthLabel, parallelThreshold);

    // Serial argmax, strict '>' keeps the first of equal gains
    std::size_t best = 0;
    for (std::size_t i = 1; i < gains.size(); ++i) {
        if (gains[i] > gains[best]) best = i;
    }
    return attributes[best];
}
