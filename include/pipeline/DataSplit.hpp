#pragma once

#include "tree/Sample.hpp"

struct DataParams {
    Sample train;
    Sample test;
};

// Ordered split: the first trainRatio share trains, the rest tests.
// trainRatio must lie in (0, 1]; returns false when the training part
// would be empty.
bool splitDataset(const Sample& sample,
                  double trainRatio,
                  DataParams& out);
