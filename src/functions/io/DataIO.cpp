// =============================================================================
// src/functions/io/DataIO.cpp
// =============================================================================
#include "functions/io/DataIO.hpp"
#include <fstream>
#include <sstream>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace {

std::vector<std::string> splitLine(const std::string& line) {
    std::vector<std::string> cells;
    std::stringstream ss(line);
    std::string cell;
    while (std::getline(ss, cell, ',')) {
        // Tolerate CRLF files
        if (!cell.empty() && cell.back() == '\r') cell.pop_back();
        cells.push_back(cell);
    }
    return cells;
}

} // namespace

Dataset DataIO::readCSV(const std::string& filename) const {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Unable to open file: " + filename);
    }

    std::string line;
    if (!std::getline(file, line)) {
        throw std::runtime_error("Empty file: " + filename);
    }

    Dataset out;
    auto header = splitLine(line);
    if (header.size() < 2) {
        throw std::runtime_error("Header needs at least one attribute and a label column: " + filename);
    }
    header.pop_back(); // label column
    out.attributes = std::move(header);

    const size_t numAttrs = out.attributes.size();
    size_t lineNo = 1;

    while (std::getline(file, line)) {
        ++lineNo;
        if (line.empty() || line == "\r") continue;

        const auto cells = splitLine(line);
        if (cells.size() != numAttrs + 1) {
            std::cerr << "Warning: line " << lineNo << " has " << cells.size()
                      << " columns, expected " << (numAttrs + 1) << ", skipped" << std::endl;
            continue;
        }

        Label label;
        try {
            std::size_t used = 0;
            label = std::stoi(cells.back(), &used);
            if (used != cells.back().size()) {
                throw std::invalid_argument("trailing characters");
            }
        } catch (const std::exception& e) {
            std::cerr << "Warning: line " << lineNo << " label '" << cells.back()
                      << "' is not an integer (" << e.what() << "), skipped" << std::endl;
            continue;
        }

        Example example;
        example.reserve(numAttrs);
        for (size_t c = 0; c < numAttrs; ++c) {
            double value = 0.0;
            try {
                value = std::stod(cells[c]);
            } catch (const std::exception& e) {
                std::cerr << "Warning: Failed to parse value '" << cells[c]
                          << "' as double: " << e.what() << std::endl;
            }
            example.emplace(out.attributes[c], value);
        }
        out.sample.emplace_back(std::move(example), label);
    }

    std::cout << "Loaded " << out.sample.size() << " examples with "
              << numAttrs << " attributes each" << std::endl;

    return out;
}

void DataIO::writePredictions(const std::vector<bool>& predictions,
                              const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Unable to open file: " + filename);
    }

    for (bool p : predictions) {
        file << (p ? 1 : 0) << '\n';
    }
}
