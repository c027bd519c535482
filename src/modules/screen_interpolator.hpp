#pragma once

#include "modules/frame_metadata.hpp"
#include "modules/interpolator.hpp"

#include <expected>
#include <memory>
#include <string>
#include <vector>

namespace experanto::modules {

// Maps query times to the latest frame whose onset precedes them, across a
// recording split into chunk files. Layout under the root folder:
//   timestamps.npy       per-frame onset times, strictly increasing
//   meta/NNNNN.yml       one metadata file per chunk
//   data/<stem>.npy      frames of that chunk
// Chunk files are read on every interpolate() call that needs them.
class ScreenInterpolator : public Interpolator {
public:
    // Queries are nudged forward by this much before the onset search so a
    // time equal to an onset resolves to that frame.
    static constexpr double kOnsetEpsilon = 1e-6;

    static std::expected<std::unique_ptr<ScreenInterpolator>, InterpolatorError> create(const std::string& root_folder);
    static std::expected<std::unique_ptr<ScreenInterpolator>, InterpolatorError> create(const std::string& root_folder,
                                                                                        const core::Metadata& meta);

    ~ScreenInterpolator() override = default;

    // Times must be strictly increasing once filtered to the valid interval.
    // values has shape (num_valid,) + image_size.
    std::expected<Interpolation, InterpolatorError> interpolate(const std::vector<double>& times) const override;
    std::string modality() const override { return "screen"; }

    // Global frame index for each of the (already valid, sorted) times
    std::expected<std::vector<size_t>, InterpolatorError> resolve_frames(const std::vector<double>& valid_times) const;

    size_t num_frames() const { return timestamps_.size(); }
    const std::vector<double>& timestamps() const { return timestamps_; }
    const core::Shape& image_size() const { return image_size_; }
    const std::vector<FrameMetadata>& chunks() const { return chunks_; }
    size_t chunk_of_frame(size_t frame) const { return frame_chunk_[frame]; }

private:
    ScreenInterpolator() = default;

    std::expected<void, InterpolatorError> init_timestamps();
    std::expected<void, InterpolatorError> init_chunks();
    std::expected<void, InterpolatorError> gather_chunk(size_t chunk, const std::vector<size_t>& frames,
                                                        const std::vector<size_t>& positions, core::Tensor& out) const;

    std::vector<double> timestamps_;
    std::vector<FrameMetadata> chunks_;     // sorted by chunk number
    std::vector<std::string> data_files_;   // parallel to chunks_
    std::vector<size_t> frame_chunk_;       // global frame -> chunk
    core::Shape image_size_;
};

} // namespace experanto::modules
