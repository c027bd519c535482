#pragma once

#include "modules/interpolator.hpp"

#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace experanto::modules {

using InterpolatorCreator = std::function<std::expected<std::unique_ptr<Interpolator>, InterpolatorError>(
    const std::string& root_folder, const core::Metadata& meta)>;

// Picks the concrete interpolator from the `modality` tag in a recording's
// meta.yml. Tags are matched case-insensitively.
class InterpolatorFactory {
public:
    // Registers "sequence" and "screen"
    InterpolatorFactory();

    void register_modality(const std::string& tag, InterpolatorCreator creator);
    bool has_modality(const std::string& tag) const;
    std::vector<std::string> modalities() const;

    std::expected<std::unique_ptr<Interpolator>, InterpolatorError> create(const std::string& root_folder) const;

private:
    std::map<std::string, InterpolatorCreator> creators_;
};

} // namespace experanto::modules
