// =============================================================================
// include/functions/io/DataIO.hpp
// =============================================================================
#pragma once

#include "tree/Sample.hpp"
#include <string>
#include <vector>

// Headered CSV: every column but the last is an attribute named by its
// header cell, the last column is an integer label
struct Dataset {
    std::vector<std::string> attributes;   // header order, used as split order
    Sample sample;
};

class DataIO {
public:
    // Throws std::runtime_error when the file cannot be opened or has no header.
    // Unparseable attribute cells warn and become 0.0, rows with an
    // unparseable label are skipped.
    Dataset readCSV(const std::string& filename) const;

    // One 0/1 line per prediction. Throws std::runtime_error on open failure.
    void writePredictions(const std::vector<bool>& predictions,
                          const std::string& filename) const;
};
