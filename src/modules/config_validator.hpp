#pragma once

#include "modules/config_module.hpp"
#include <string>
#include <vector>

namespace experanto::modules {

class ConfigValidator {
public:
    // Returns a list of error messages. Empty = valid.
    static std::vector<std::string> validate(const ProbeConfig& config);
};

} // namespace experanto::modules
