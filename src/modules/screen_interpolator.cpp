#include "modules/screen_interpolator.hpp"

#include "core/npy_io.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <map>
#include <regex>
#include <string>

namespace experanto::modules {

namespace fs = std::filesystem;

std::expected<std::unique_ptr<ScreenInterpolator>, InterpolatorError> ScreenInterpolator::create(const std::string& root_folder) {
    auto meta = load_recording_metadata(root_folder);
    if (!meta) return std::unexpected(meta.error());
    return create(root_folder, *meta);
}

std::expected<std::unique_ptr<ScreenInterpolator>, InterpolatorError> ScreenInterpolator::create(const std::string& root_folder,
                                                                                                 const core::Metadata& meta) {
    auto interp = std::unique_ptr<ScreenInterpolator>(new ScreenInterpolator());

    if (auto res = interp->init_common(root_folder, meta); !res) return std::unexpected(res.error());
    if (auto res = interp->init_timestamps(); !res) return std::unexpected(res.error());
    if (auto res = interp->init_chunks(); !res) return std::unexpected(res.error());

    std::cout << "[Screen] Loaded " << root_folder << ": " << interp->num_frames() << " frames in "
              << interp->chunks_.size() << " chunks, image size " << core::shape_to_string(interp->image_size_)
              << ", valid " << interp->valid_interval_.to_string() << "\n";
    return interp;
}

std::expected<void, InterpolatorError> ScreenInterpolator::init_timestamps() {
    std::string path = (fs::path(this->root_folder_) / "timestamps.npy").string();
    auto timestamps = core::load_npy(path);
    if (!timestamps) {
        std::cerr << "[Screen] Failed to load " << path << ": " << core::error_to_string(timestamps.error()) << "\n";
        return std::unexpected(timestamps.error() == core::ArrayError::FileNotFound ? InterpolatorError::DataNotFound
                                                                                    : InterpolatorError::DataShapeMismatch);
    }
    if (timestamps->rank() != 1) {
        std::cerr << "[Screen] " << path << " must be 1-D, got shape " << core::shape_to_string(timestamps->shape()) << "\n";
        return std::unexpected(InterpolatorError::DataShapeMismatch);
    }

    this->timestamps_ = timestamps->values();
    auto bad = std::adjacent_find(this->timestamps_.begin(), this->timestamps_.end(),
                                  [](double a, double b) { return b <= a; });
    if (bad != this->timestamps_.end()) {
        std::cerr << "[Screen] " << path << " is not strictly increasing at frame "
                  << std::distance(this->timestamps_.begin(), bad) << "\n";
        return std::unexpected(InterpolatorError::UnsortedTimestamps);
    }
    return {};
}

std::expected<void, InterpolatorError> ScreenInterpolator::init_chunks() {
    fs::path meta_dir = fs::path(this->root_folder_) / "meta";
    std::error_code ec;
    if (!fs::is_directory(meta_dir, ec)) {
        std::cerr << "[Screen] Missing chunk metadata directory " << meta_dir << "\n";
        return std::unexpected(InterpolatorError::MetadataNotFound);
    }

    static const std::regex kNumberedYml(R"(\d{5}\.yml)");
    std::vector<fs::path> meta_files;
    for (const auto& entry : fs::directory_iterator(meta_dir, ec)) {
        if (entry.is_regular_file() && std::regex_match(entry.path().filename().string(), kNumberedYml)) {
            meta_files.push_back(entry.path());
        }
    }
    if (ec) {
        std::cerr << "[Screen] Failed to list " << meta_dir << ": " << ec.message() << "\n";
        return std::unexpected(InterpolatorError::MetadataNotFound);
    }
    if (meta_files.empty()) {
        std::cerr << "[Screen] No chunk metadata in " << meta_dir << "\n";
        return std::unexpected(InterpolatorError::MetadataNotFound);
    }
    std::sort(meta_files.begin(), meta_files.end(), [](const fs::path& a, const fs::path& b) {
        return std::stoi(a.stem().string()) < std::stoi(b.stem().string());
    });

    for (const auto& file : meta_files) {
        auto chunk = load_frame_metadata(file.string());
        if (!chunk) return std::unexpected(chunk.error());
        this->chunks_.push_back(std::move(*chunk));
    }

    this->image_size_ = this->chunks_.front().image_size;
    for (size_t i = 0; i < this->chunks_.size(); ++i) {
        const auto& chunk = this->chunks_[i];
        if (chunk.image_size != this->image_size_) {
            std::cerr << "[Screen] All chunks must have the same image size: chunk " << chunk.file_name
                      << " is " << core::shape_to_string(chunk.image_size) << ", expected "
                      << core::shape_to_string(this->image_size_) << "\n";
            return std::unexpected(InterpolatorError::ImageSizeMismatch);
        }
        if (chunk.first_frame != this->frame_chunk_.size()) {
            std::cerr << "[Screen] Chunk " << chunk.file_name << " starts at frame " << chunk.first_frame
                      << ", previous chunks end at " << this->frame_chunk_.size() << "\n";
            return std::unexpected(InterpolatorError::FrameCountMismatch);
        }
        this->frame_chunk_.insert(this->frame_chunk_.end(), chunk.num_frames, i);
        this->data_files_.push_back((fs::path(this->root_folder_) / "data" / (chunk.file_name + ".npy")).string());
    }

    if (this->frame_chunk_.size() != this->timestamps_.size()) {
        std::cerr << "[Screen] Chunks describe " << this->frame_chunk_.size() << " frames but "
                  << this->timestamps_.size() << " timestamps were recorded\n";
        return std::unexpected(InterpolatorError::FrameCountMismatch);
    }
    return {};
}

std::expected<std::vector<size_t>, InterpolatorError> ScreenInterpolator::resolve_frames(const std::vector<double>& valid_times) const {
    std::vector<double> nudged(valid_times.size());
    std::transform(valid_times.begin(), valid_times.end(), nudged.begin(),
                   [](double t) { return t + kOnsetEpsilon; });

    auto bad = std::adjacent_find(nudged.begin(), nudged.end(), [](double a, double b) { return b <= a; });
    if (bad != nudged.end()) {
        std::cerr << "[Screen] Times must be sorted: " << *(bad + 1) - kOnsetEpsilon
                  << " follows " << *bad - kOnsetEpsilon << "\n";
        return std::unexpected(InterpolatorError::UnsortedTimes);
    }

    std::vector<size_t> frames(nudged.size());
    for (size_t i = 0; i < nudged.size(); ++i) {
        // latest onset <= query
        auto it = std::upper_bound(this->timestamps_.begin(), this->timestamps_.end(), nudged[i]);
        auto idx = std::distance(this->timestamps_.begin(), it) - 1;
        if (idx < 0 || static_cast<size_t>(idx) >= this->timestamps_.size()) {
            std::cerr << "[Screen] Time " << valid_times[i] << " resolves to frame " << idx
                      << ", outside [0, " << this->timestamps_.size() << ")\n";
            return std::unexpected(InterpolatorError::FrameIndexOutOfRange);
        }
        frames[i] = static_cast<size_t>(idx);
    }
    return frames;
}

std::expected<Interpolation, InterpolatorError> ScreenInterpolator::interpolate(const std::vector<double>& times) const {
    Interpolation result;
    result.valid = valid_times(times);
    auto valid = select_valid(times, result.valid);

    auto frames = resolve_frames(valid);
    if (!frames) return std::unexpected(frames.error());

    core::Shape out_shape = {valid.size()};
    out_shape.insert(out_shape.end(), this->image_size_.begin(), this->image_size_.end());
    result.values = core::Tensor(out_shape);

    // Output positions grouped by chunk, each chunk is read once
    std::map<size_t, std::vector<size_t>> positions_by_chunk;
    for (size_t i = 0; i < frames->size(); ++i) {
        positions_by_chunk[this->frame_chunk_[(*frames)[i]]].push_back(i);
    }

    for (const auto& [chunk, positions] : positions_by_chunk) {
        if (auto res = gather_chunk(chunk, *frames, positions, result.values); !res) {
            return std::unexpected(res.error());
        }
    }
    return result;
}

std::expected<void, InterpolatorError> ScreenInterpolator::gather_chunk(size_t chunk, const std::vector<size_t>& frames,
                                                                        const std::vector<size_t>& positions,
                                                                        core::Tensor& out) const {
    const auto& meta = this->chunks_[chunk];
    const auto& path = this->data_files_[chunk];

    auto data = core::load_npy(path);
    if (!data) {
        std::cerr << "[Screen] Failed to load chunk " << path << ": " << core::error_to_string(data.error()) << "\n";
        return std::unexpected(data.error() == core::ArrayError::FileNotFound ? InterpolatorError::DataNotFound
                                                                              : InterpolatorError::DataShapeMismatch);
    }

    // An image chunk may store its still without a frame axis
    bool single_still = meta.modality == FrameModality::Image && data->shape() == this->image_size_;
    if (!single_still && data->frame_shape() != this->image_size_) {
        std::cerr << "[Screen] Chunk " << path << " has shape " << core::shape_to_string(data->shape())
                  << ", frames must be " << core::shape_to_string(this->image_size_) << "\n";
        return std::unexpected(InterpolatorError::DataShapeMismatch);
    }

    const size_t frame_size = out.frame_size();
    const size_t stored_frames = single_still ? 1 : data->shape()[0];
    for (size_t pos : positions) {
        size_t local = frames[pos] - meta.first_frame;
        const double* src = nullptr;
        if (single_still) {
            src = data->data();
        } else if (local < stored_frames) {
            src = data->frame(local);
        } else {
            std::cerr << "[Screen] Frame " << frames[pos] << " maps to offset " << local << " in " << path
                      << ", which holds " << stored_frames << " frames\n";
            return std::unexpected(InterpolatorError::FrameIndexOutOfRange);
        }
        std::copy(src, src + frame_size, out.frame(pos));
    }
    return {};
}

} // namespace experanto::modules
