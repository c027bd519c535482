#include "modules/frame_metadata.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <utility>

namespace experanto::modules {

namespace {

constexpr size_t kImageFrameCount = 2;

const std::array<std::pair<const char*, FrameModality>, 2> kFrameModalities = {{
    {"image", FrameModality::Image},
    {"video", FrameModality::Video},
}};

} // namespace

std::string frame_modality_to_string(FrameModality modality) {
    for (const auto& [name, value] : kFrameModalities) {
        if (value == modality) return name;
    }
    return "unknown";
}

std::expected<FrameModality, InterpolatorError> frame_modality_from_string(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const auto& [name, modality] : kFrameModalities) {
        if (lowered == name) return modality;
    }
    return std::unexpected(InterpolatorError::UnknownFrameModality);
}

std::expected<FrameMetadata, InterpolatorError> parse_frame_metadata(const std::string& file_name, const core::Metadata& data) {
    auto tag = core::require_string(data, "modality");
    if (!tag) {
        std::cerr << "[Screen] Chunk " << file_name << " has no modality\n";
        return std::unexpected(InterpolatorError::MetadataInvalid);
    }
    auto modality = frame_modality_from_string(*tag);
    if (!modality) {
        std::cerr << "[Screen] Unknown chunk modality '" << *tag << "' in " << file_name << "\n";
        return std::unexpected(modality.error());
    }

    FrameMetadata meta;
    meta.modality = *modality;
    meta.file_name = file_name;
    meta.attributes = data;

    if (!data.contains("image_size") || !data["image_size"].is_array() || data["image_size"].empty()) {
        std::cerr << "[Screen] Chunk " << file_name << " has no image_size\n";
        return std::unexpected(InterpolatorError::MetadataInvalid);
    }
    for (const auto& dim : data["image_size"]) {
        if (!dim.is_number_integer() || dim.get<int64_t>() < 0) {
            std::cerr << "[Screen] Chunk " << file_name << " has a malformed image_size: " << data["image_size"].dump() << "\n";
            return std::unexpected(InterpolatorError::MetadataInvalid);
        }
        meta.image_size.push_back(dim.get<size_t>());
    }

    auto first_frame = core::require_integer(data, "first_frame");
    if (!first_frame || *first_frame < 0) {
        std::cerr << "[Screen] Chunk " << file_name << " has no valid first_frame\n";
        return std::unexpected(InterpolatorError::MetadataInvalid);
    }
    meta.first_frame = static_cast<size_t>(*first_frame);

    if (meta.modality == FrameModality::Image) {
        meta.num_frames = kImageFrameCount;
    } else {
        auto num_frames = core::require_integer(data, "num_frames");
        if (!num_frames || *num_frames < 0) {
            std::cerr << "[Screen] Video chunk " << file_name << " has no valid num_frames\n";
            return std::unexpected(InterpolatorError::MetadataInvalid);
        }
        meta.num_frames = static_cast<size_t>(*num_frames);
    }

    return meta;
}

std::expected<FrameMetadata, InterpolatorError> load_frame_metadata(const std::string& filepath) {
    auto data = core::load_metadata(filepath);
    if (!data) {
        return std::unexpected(data.error() == core::MetadataError::FileNotFound
                                   ? InterpolatorError::MetadataNotFound
                                   : InterpolatorError::MetadataInvalid);
    }
    return parse_frame_metadata(std::filesystem::path(filepath).stem().string(), *data);
}

} // namespace experanto::modules
