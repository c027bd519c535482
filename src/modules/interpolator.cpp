#include "modules/interpolator.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <utility>

namespace experanto::modules {

std::string error_to_string(InterpolatorError err) {
    switch (err) {
        case InterpolatorError::MetadataNotFound: return "MetadataNotFound";
        case InterpolatorError::MetadataInvalid: return "MetadataInvalid";
        case InterpolatorError::UnknownModality: return "UnknownModality";
        case InterpolatorError::UnknownFrameModality: return "UnknownFrameModality";
        case InterpolatorError::DataNotFound: return "DataNotFound";
        case InterpolatorError::DataShapeMismatch: return "DataShapeMismatch";
        case InterpolatorError::ImageSizeMismatch: return "ImageSizeMismatch";
        case InterpolatorError::FrameCountMismatch: return "FrameCountMismatch";
        case InterpolatorError::UnsortedTimestamps: return "UnsortedTimestamps";
        case InterpolatorError::UnsortedTimes: return "UnsortedTimes";
        case InterpolatorError::FrameIndexOutOfRange: return "FrameIndexOutOfRange";
        default: return "Unknown Error";
    }
}

std::expected<core::Metadata, InterpolatorError> load_recording_metadata(const std::string& root_folder) {
    auto meta = core::load_metadata((std::filesystem::path(root_folder) / "meta.yml").string());
    if (!meta) {
        if (meta.error() == core::MetadataError::FileNotFound) {
            return std::unexpected(InterpolatorError::MetadataNotFound);
        }
        return std::unexpected(InterpolatorError::MetadataInvalid);
    }
    return std::move(*meta);
}

std::expected<void, InterpolatorError> Interpolator::init_common(const std::string& root_folder, const core::Metadata& meta) {
    this->root_folder_ = root_folder;
    this->meta_ = meta;

    auto start = core::require_number(meta, "start_time");
    auto end = core::require_number(meta, "end_time");
    if (!start || !end) {
        std::cerr << "[Interpolator] " << root_folder << ": start_time/end_time missing or not numeric\n";
        return std::unexpected(InterpolatorError::MetadataInvalid);
    }
    if (*start > *end) {
        std::cerr << "[Interpolator] " << root_folder << ": start_time " << *start
                  << " is after end_time " << *end << "\n";
        return std::unexpected(InterpolatorError::MetadataInvalid);
    }

    this->start_time_ = *start;
    this->end_time_ = *end;
    this->valid_interval_ = {*start, *end};
    return {};
}

std::vector<bool> Interpolator::valid_times(const std::vector<double>& times) const {
    return this->valid_interval_.intersect(times);
}

bool Interpolator::contains(const std::vector<double>& times) const {
    return std::any_of(times.begin(), times.end(), [this](double t) { return this->valid_interval_.contains(t); });
}

std::vector<double> Interpolator::select_valid(const std::vector<double>& times, const std::vector<bool>& valid) {
    std::vector<double> out;
    for (size_t i = 0; i < times.size(); ++i) {
        if (valid[i]) out.push_back(times[i]);
    }
    return out;
}

} // namespace experanto::modules
