#include "pipeline/DataSplit.hpp"
#include <cmath>

bool splitDataset(const Sample& sample,
                  double trainRatio,
                  DataParams& out) {
    if (!(trainRatio > 0.0 && trainRatio <= 1.0)) return false;

    size_t trainRows = static_cast<size_t>(std::llround(sample.size() * trainRatio));
    if (trainRows == 0) return false;

    out.train.assign(sample.begin(), sample.begin() + trainRows);
    out.test.assign(sample.begin() + trainRows, sample.end());
    return true;
}
