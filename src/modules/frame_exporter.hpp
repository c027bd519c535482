#pragma once

#include "core/tensor.hpp"

#include <expected>
#include <string>

namespace experanto::modules {

enum class MediaError {
    FileNotFound,
    UnsupportedFormat,
    InternalError
};

std::string error_to_string(MediaError err);

class FrameExporter {
public:
    // Writes one screen frame as an 8-bit PNG. image_size is [H, W] (gray) or
    // [H, W, C] with C in {1, 3, 4}. Values are clamped to [0, 255].
    static std::expected<void, MediaError> save_png(const std::string& filepath, const double* frame,
                                                    const core::Shape& image_size);
};

} // namespace experanto::modules
