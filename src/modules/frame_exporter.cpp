#include "modules/frame_exporter.hpp"

#include <png.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <iostream>
#include <vector>

namespace experanto::modules {

std::string error_to_string(MediaError err) {
    switch (err) {
        case MediaError::FileNotFound: return "FileNotFound";
        case MediaError::UnsupportedFormat: return "UnsupportedFormat";
        case MediaError::InternalError: return "InternalError";
        default: return "Unknown Error";
    }
}

std::expected<void, MediaError> FrameExporter::save_png(const std::string& filepath, const double* frame,
                                                        const core::Shape& image_size) {
    if (image_size.size() < 2 || image_size.size() > 3 || image_size[0] == 0 || image_size[1] == 0) {
        std::cerr << "[Export] Cannot write frame of size " << core::shape_to_string(image_size) << " as PNG\n";
        return std::unexpected(MediaError::UnsupportedFormat);
    }

    const size_t height = image_size[0];
    const size_t width = image_size[1];
    const size_t channels = image_size.size() == 3 ? image_size[2] : 1;

    int color_type = 0;
    switch (channels) {
        case 1: color_type = PNG_COLOR_TYPE_GRAY; break;
        case 3: color_type = PNG_COLOR_TYPE_RGB; break;
        case 4: color_type = PNG_COLOR_TYPE_RGBA; break;
        default:
            std::cerr << "[Export] Unsupported channel count " << channels << " for " << filepath << "\n";
            return std::unexpected(MediaError::UnsupportedFormat);
    }

    std::vector<uint8_t> pixels(height * width * channels);
    for (size_t i = 0; i < pixels.size(); ++i) {
        pixels[i] = static_cast<uint8_t>(std::clamp(std::round(frame[i]), 0.0, 255.0));
    }

    FILE* fp = std::fopen(filepath.c_str(), "wb");
    if (!fp) {
        std::cerr << "[Export] Failed to open " << filepath << " for writing\n";
        return std::unexpected(MediaError::FileNotFound);
    }

    png_structp png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (!png) {
        std::fclose(fp);
        return std::unexpected(MediaError::InternalError);
    }

    png_infop info = png_create_info_struct(png);
    if (!info) {
        png_destroy_write_struct(&png, nullptr);
        std::fclose(fp);
        return std::unexpected(MediaError::InternalError);
    }

    std::vector<png_bytep> row_pointers(height);
    for (size_t y = 0; y < height; y++) {
        row_pointers[y] = pixels.data() + y * width * channels;
    }

    if (setjmp(png_jmpbuf(png))) {
        png_destroy_write_struct(&png, &info);
        std::fclose(fp);
        return std::unexpected(MediaError::InternalError);
    }

    png_init_io(png, fp);
    png_set_IHDR(
        png, info, static_cast<png_uint_32>(width), static_cast<png_uint_32>(height),
        8, color_type, PNG_INTERLACE_NONE,
        PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT
    );

    png_write_info(png, info);
    png_write_image(png, row_pointers.data());
    png_write_end(png, nullptr);

    png_destroy_write_struct(&png, &info);
    std::fclose(fp);
    return {};
}

} // namespace experanto::modules
