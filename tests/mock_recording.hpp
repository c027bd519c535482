#ifndef MOCK_RECORDING_HPP
#define MOCK_RECORDING_HPP

#include "core/tensor.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace experanto::tests::mock {

// Synthetic recordings written in the on-disk layout the interpolators read.

struct SequenceOptions {
    size_t n_signals = 10;
    bool shifts_per_signal = false;
    bool use_mem_mapped = false;
    double t_end = 10.0;
    double sampling_rate = 10.0;
    unsigned seed = 42;
};

struct SequenceFixture {
    std::vector<double> timestamps;
    core::Tensor data;            // [n_timestamps, n_signals]
    std::vector<double> shifts;   // empty unless shifts_per_signal
};

SequenceFixture create_sequence_data(const std::filesystem::path& root, const SequenceOptions& options = {});

struct ChunkSpec {
    std::string modality = "video";
    size_t num_frames = 0;        // ignored for image chunks (always 2)
    bool store_still = false;     // image chunk data saved without a frame axis
};

struct ScreenOptions {
    std::vector<ChunkSpec> chunks = {ChunkSpec{"video", 10}};
    core::Shape image_size = {4, 6};
    std::vector<double> timestamps;   // default: i * frame_interval
    double frame_interval = 0.5;
    double start_time = 0.0;
    double end_time = -1.0;           // default: last onset + frame_interval
};

struct ScreenFixture {
    std::vector<double> timestamps;
    core::Tensor frames;              // every logical frame, [n_frames] + image_size
};

ScreenFixture create_screen_data(const std::filesystem::path& root, const ScreenOptions& options = {});

// Pixel value used for frame `frame`, element `pixel`
double frame_value(size_t frame, size_t pixel);

// Fresh scratch directory under the system temp dir
std::filesystem::path make_temp_root(const std::string& prefix);

} // namespace experanto::tests::mock

#endif // MOCK_RECORDING_HPP
