#pragma once

#include <stdexcept>
#include <string>

class EmptySampleError : public std::invalid_argument {
public:
    explicit EmptySampleError(const std::string& where)
        : std::invalid_argument(where + ": sample is empty") {}
};

class NoAttributesError : public std::invalid_argument {
public:
    explicit NoAttributesError(const std::string& where)
        : std::invalid_argument(where + ": no candidate attributes") {}
};

// Raised when induction cannot reach a pure partition
class TreeDidNotConvergeError : public std::runtime_error {
public:
    explicit TreeDidNotConvergeError(const std::string& reason)
        : std::runtime_error("Tree did not converge: " + reason) {}
};
