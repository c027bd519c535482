#include "modules/config_validator.hpp"

#include <set>

namespace experanto::modules {

std::vector<std::string> ConfigValidator::validate(const ProbeConfig& config) {
    std::vector<std::string> errors;

    // 1. Recordings
    if (config.recordings.empty()) {
        errors.push_back("No recordings configured.");
    }
    std::set<std::string> seen;
    for (size_t i = 0; i < config.recordings.size(); ++i) {
        const auto& root = config.recordings[i];
        std::string ctx = "recordings[" + std::to_string(i) + "]";
        if (root.empty()) {
            errors.push_back(ctx + ": empty path.");
        } else if (!seen.insert(root).second) {
            errors.push_back(ctx + ": duplicate recording '" + root + "'.");
        }
    }

    // 2. Query grid (ignored when explicit values are given)
    if (config.times.values.empty()) {
        if (config.times.step <= 0.0) {
            errors.push_back("times.step must be positive: " + std::to_string(config.times.step));
        }
        if (config.times.stop < config.times.start) {
            errors.push_back("times.stop (" + std::to_string(config.times.stop) + ") is before times.start (" +
                             std::to_string(config.times.start) + ")");
        }
    }

    // 3. Output
    if (config.print_limit < 0) {
        errors.push_back("print_limit must not be negative: " + std::to_string(config.print_limit));
    }

    return errors;
}

} // namespace experanto::modules
