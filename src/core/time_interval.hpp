#pragma once

#include <string>
#include <vector>

namespace experanto::core {

// Half-open interval [start, end). start == end contains nothing.
struct TimeInterval {
    double start = 0.0;
    double end = 0.0;

    bool contains(double time) const { return start <= time && time < end; }

    // Elementwise membership, one entry per input time
    std::vector<bool> intersect(const std::vector<double>& times) const;

    std::string to_string() const;
};

} // namespace experanto::core
