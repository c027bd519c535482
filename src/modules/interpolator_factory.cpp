#include "modules/interpolator_factory.hpp"

#include "modules/screen_interpolator.hpp"
#include "modules/sequence_interpolator.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace experanto::modules {

namespace {

std::string normalize_tag(std::string tag) {
    std::transform(tag.begin(), tag.end(), tag.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return tag;
}

template <typename T>
InterpolatorCreator creator_for() {
    return [](const std::string& root_folder, const core::Metadata& meta)
               -> std::expected<std::unique_ptr<Interpolator>, InterpolatorError> {
        auto interp = T::create(root_folder, meta);
        if (!interp) return std::unexpected(interp.error());
        return std::unique_ptr<Interpolator>(std::move(*interp));
    };
}

} // namespace

InterpolatorFactory::InterpolatorFactory() {
    register_modality("sequence", creator_for<SequenceInterpolator>());
    register_modality("screen", creator_for<ScreenInterpolator>());
}

void InterpolatorFactory::register_modality(const std::string& tag, InterpolatorCreator creator) {
    this->creators_[normalize_tag(tag)] = std::move(creator);
}

bool InterpolatorFactory::has_modality(const std::string& tag) const {
    return this->creators_.contains(normalize_tag(tag));
}

std::vector<std::string> InterpolatorFactory::modalities() const {
    std::vector<std::string> tags;
    for (const auto& [tag, creator] : this->creators_) {
        tags.push_back(tag);
    }
    return tags;
}

std::expected<std::unique_ptr<Interpolator>, InterpolatorError> InterpolatorFactory::create(const std::string& root_folder) const {
    auto meta = load_recording_metadata(root_folder);
    if (!meta) return std::unexpected(meta.error());

    auto tag = core::require_string(*meta, "modality");
    if (!tag) {
        std::cerr << "[Factory] " << root_folder << ": meta.yml has no modality\n";
        return std::unexpected(InterpolatorError::MetadataInvalid);
    }

    auto it = this->creators_.find(normalize_tag(*tag));
    if (it == this->creators_.end()) {
        std::cerr << "[Factory] Unknown modality: " << *tag << "\n";
        return std::unexpected(InterpolatorError::UnknownModality);
    }
    return it->second(root_folder, *meta);
}

} // namespace experanto::modules
