#pragma once

#include "core/metadata.hpp"
#include "core/tensor.hpp"
#include "modules/interpolator.hpp"

#include <expected>
#include <string>

namespace experanto::modules {

enum class FrameModality {
    Image,  // single still, exposed as a two-frame asset
    Video
};

std::string frame_modality_to_string(FrameModality modality);
std::expected<FrameModality, InterpolatorError> frame_modality_from_string(const std::string& value);

// One contiguous, file-backed run of screen frames.
struct FrameMetadata {
    FrameModality modality = FrameModality::Video;
    std::string file_name;      // stem of the chunk, data lives in data/<file_name>.npy
    core::Shape image_size;
    size_t first_frame = 0;     // global index of the chunk's first frame
    size_t num_frames = 0;
    core::Metadata attributes;  // raw chunk mapping
};

std::expected<FrameMetadata, InterpolatorError> parse_frame_metadata(const std::string& file_name, const core::Metadata& data);

// Loads a numbered chunk file (e.g. meta/00003.yml); file_name becomes "00003".
std::expected<FrameMetadata, InterpolatorError> load_frame_metadata(const std::string& filepath);

} // namespace experanto::modules
