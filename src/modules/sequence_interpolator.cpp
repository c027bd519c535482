#include "modules/sequence_interpolator.hpp"

#include "core/npy_io.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <limits>

namespace experanto::modules {

namespace fs = std::filesystem;

namespace {

// Optional boolean switch in meta.yml. Absent means off; 0 and 1 also count.
std::expected<bool, InterpolatorError> metadata_flag(const core::Metadata& meta, const std::string& key) {
    auto flag = core::require_bool(meta, key);
    if (flag) return *flag;
    if (flag.error() == core::MetadataError::MissingField) return false;

    auto number = core::require_integer(meta, key);
    if (number && (*number == 0 || *number == 1)) return *number == 1;
    return std::unexpected(InterpolatorError::MetadataInvalid);
}

} // namespace

std::expected<std::unique_ptr<SequenceInterpolator>, InterpolatorError> SequenceInterpolator::create(const std::string& root_folder) {
    auto meta = load_recording_metadata(root_folder);
    if (!meta) return std::unexpected(meta.error());
    return create(root_folder, *meta);
}

std::expected<std::unique_ptr<SequenceInterpolator>, InterpolatorError> SequenceInterpolator::create(const std::string& root_folder,
                                                                                                     const core::Metadata& meta) {
    auto interp = std::unique_ptr<SequenceInterpolator>(new SequenceInterpolator());

    if (auto res = interp->init_common(root_folder, meta); !res) return std::unexpected(res.error());

    auto rate = core::require_number(meta, "sampling_rate");
    if (!rate || *rate <= 0.0) {
        std::cerr << "[Sequence] " << root_folder << ": sampling_rate missing or not positive\n";
        return std::unexpected(InterpolatorError::MetadataInvalid);
    }
    interp->time_delta_ = 1.0 / *rate;
    auto phase_shift = metadata_flag(meta, "phase_shift_per_signal");
    if (!phase_shift) {
        std::cerr << "[Sequence] " << root_folder << ": phase_shift_per_signal must be a boolean\n";
        return std::unexpected(phase_shift.error());
    }
    interp->use_phase_shifts_ = *phase_shift;

    if (auto res = interp->init_data(); !res) return std::unexpected(res.error());
    if (auto res = interp->init_phase_shifts(); !res) return std::unexpected(res.error());
    if (auto res = interp->check_coverage(); !res) return std::unexpected(res.error());

    std::cout << "[Sequence] Loaded " << root_folder << ": " << interp->num_samples() << " samples x "
              << interp->num_signals() << " signals @ " << *rate << " Hz, valid "
              << interp->valid_interval_.to_string() << "\n";
    return interp;
}

std::expected<void, InterpolatorError> SequenceInterpolator::init_data() {
    std::string path = (fs::path(this->root_folder_) / "data.npy").string();

    auto mem_mapped = metadata_flag(this->meta_, "is_mem_mapped");
    if (!mem_mapped) {
        std::cerr << "[Sequence] " << this->root_folder_ << ": is_mem_mapped must be a boolean\n";
        return std::unexpected(mem_mapped.error());
    }

    std::expected<core::Tensor, core::ArrayError> data;
    if (*mem_mapped) {
        // numpy.memmap dump: no header, layout comes from the metadata
        auto dtype = core::require_string(this->meta_, "dtype");
        auto rows = core::require_integer(this->meta_, "n_timestamps");
        auto cols = core::require_integer(this->meta_, "n_signals");
        if (!dtype || !rows || !cols || *rows < 0 || *cols < 0) {
            std::cerr << "[Sequence] " << this->root_folder_ << ": memory-mapped data needs dtype, n_timestamps and n_signals\n";
            return std::unexpected(InterpolatorError::MetadataInvalid);
        }
        data = core::load_raw(path, *dtype, {static_cast<size_t>(*rows), static_cast<size_t>(*cols)});
    } else {
        data = core::load_npy(path);
    }

    if (!data) {
        std::cerr << "[Sequence] Failed to load " << path << ": " << core::error_to_string(data.error()) << "\n";
        return std::unexpected(data.error() == core::ArrayError::FileNotFound ? InterpolatorError::DataNotFound
                                                                              : InterpolatorError::DataShapeMismatch);
    }

    if (data->rank() == 1) {
        // single-channel trace stored as a vector
        this->data_ = core::Tensor({data->shape()[0], 1}, data->values());
    } else if (data->rank() == 2) {
        this->data_ = std::move(*data);
    } else {
        std::cerr << "[Sequence] " << path << " must be 2-D, got shape " << core::shape_to_string(data->shape()) << "\n";
        return std::unexpected(InterpolatorError::DataShapeMismatch);
    }
    return {};
}

std::expected<void, InterpolatorError> SequenceInterpolator::init_phase_shifts() {
    if (!this->use_phase_shifts_) {
        this->phase_shifts_.assign(num_signals(), 0.0);
        return {};
    }

    std::string path = (fs::path(this->root_folder_) / "meta" / "phase_shifts.npy").string();
    auto shifts = core::load_npy(path);
    if (!shifts) {
        std::cerr << "[Sequence] Failed to load " << path << ": " << core::error_to_string(shifts.error()) << "\n";
        return std::unexpected(shifts.error() == core::ArrayError::FileNotFound ? InterpolatorError::DataNotFound
                                                                                : InterpolatorError::DataShapeMismatch);
    }
    if (shifts->size() != num_signals() || shifts->empty()) {
        std::cerr << "[Sequence] " << path << " holds " << shifts->size() << " shifts for "
                  << num_signals() << " signals\n";
        return std::unexpected(InterpolatorError::DataShapeMismatch);
    }

    this->phase_shifts_ = shifts->values();
    auto [min_shift, max_shift] = std::minmax_element(this->phase_shifts_.begin(), this->phase_shifts_.end());
    // Every channel must have a real sample at every valid time
    this->valid_interval_ = {this->start_time_ + *max_shift, this->end_time_ + *min_shift};
    return {};
}

std::expected<void, InterpolatorError> SequenceInterpolator::check_coverage() const {
    if (this->valid_interval_.start >= this->valid_interval_.end) return {};

    // Sample positions grow with time, so the latest valid time reaches the
    // largest index. Round it exactly as interpolate() does.
    const double latest = std::nextafter(this->valid_interval_.end, -std::numeric_limits<double>::infinity());
    double last = 0.0;
    for (double shift : this->phase_shifts_) {
        last = std::max(last, sample_position(latest, shift));
    }

    if (last >= static_cast<double>(num_samples())) {
        std::cerr << "[Sequence] " << this->root_folder_ << ": " << num_samples()
                  << " samples do not cover " << this->valid_interval_.to_string()
                  << " (needs sample " << last << ")\n";
        return std::unexpected(InterpolatorError::DataShapeMismatch);
    }
    return {};
}

double SequenceInterpolator::sample_position(double time, double shift) const {
    // nearbyint rounds half to even under the default rounding mode
    return std::nearbyint((time - shift - this->start_time_) / this->time_delta_);
}

std::expected<Interpolation, InterpolatorError> SequenceInterpolator::interpolate(const std::vector<double>& times) const {
    Interpolation result;
    result.valid = valid_times(times);
    auto valid = select_valid(times, result.valid);

    const size_t channels = num_signals();
    result.values = core::Tensor({valid.size(), channels});
    for (size_t i = 0; i < valid.size(); ++i) {
        for (size_t c = 0; c < channels; ++c) {
            double pos = sample_position(valid[i], this->phase_shifts_[c]);
            if (pos < 0.0 || pos >= static_cast<double>(num_samples())) {
                std::cerr << "[Sequence] Time " << valid[i] << " maps to sample " << pos << " outside [0, "
                          << num_samples() << ")\n";
                return std::unexpected(InterpolatorError::FrameIndexOutOfRange);
            }
            result.values.at(i, c) = this->data_.at(static_cast<size_t>(pos), c);
        }
    }
    return result;
}

} // namespace experanto::modules
