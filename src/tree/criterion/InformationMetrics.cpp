// src/tree/criterion/InformationMetrics.cpp - OpenMP Parallel Version
#include "criterion/InformationMetrics.hpp"
#include "tree/TreeErrors.hpp"
#include <cmath>
#ifdef _OPENMP
#include <omp.h>
#endif

double info(std::size_t positive, std::size_t negative) {
    if (positive == 0 || negative == 0) return 0.0;

    const double total  = static_cast<double>(positive + negative);
    const double pRatio = static_cast<double>(positive) / total;
    const double nRatio = static_cast<double>(negative) / total;
    return -pRatio * std::log2(pRatio) - nRatio * std::log2(nRatio);
}

std::pair<std::size_t, std::size_t>
countByLabel(const Sample& sample, Label truthLabel) {
    const long long n = static_cast<long long>(sample.size());

    long long positive = 0;
    #pragma omp parallel for reduction(+:positive) schedule(static) if(n > 1000)
    for (long long i = 0; i < n; ++i) {
        if (sample[i].second == truthLabel) ++positive;
    }

    const auto p = static_cast<std::size_t>(positive);
    return {p, sample.size() - p};
}

double entropy(const Sample& sample,
               const AttributeTest& attributeTest,
               Label truthLabel) {
    if (sample.empty()) throw EmptySampleError("entropy");

    const double total = static_cast<double>(sample.size());

    // Label counts of both partitions in one pass, without copying them
    std::size_t pT = 0, nT = 0, pF = 0, nF = 0;
    for (const auto& labeled : sample) {
        const bool positive = labeled.second == truthLabel;
        if (attributeTest(labeled.first)) {
            positive ? ++pT : ++nT;
        } else {
            positive ? ++pF : ++nF;
        }
    }

    const double tRatio = static_cast<double>(pT + nT) / total;
    const double fRatio = static_cast<double>(pF + nF) / total;
    return tRatio * info(pT, nT) + fRatio * info(pF, nF);
}

double gain(const Sample& sample,
            const AttributeTest& attributeTest,
            Label truthLabel) {
    if (sample.empty()) throw EmptySampleError("gain");

    auto [p, n] = countByLabel(sample, truthLabel);
    return info(p, n) - entropy(sample, attributeTest, truthLabel);
}
