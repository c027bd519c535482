#include "core/time_interval.hpp"

#include <sstream>

namespace experanto::core {

std::vector<bool> TimeInterval::intersect(const std::vector<double>& times) const {
    std::vector<bool> mask(times.size());
    for (size_t i = 0; i < times.size(); ++i) {
        mask[i] = contains(times[i]);
    }
    return mask;
}

std::string TimeInterval::to_string() const {
    std::ostringstream ss;
    ss << "TimeInterval [" << start << ", " << end << ")";
    return ss.str();
}

} // namespace experanto::core
