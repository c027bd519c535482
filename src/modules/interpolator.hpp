#pragma once

#include "core/metadata.hpp"
#include "core/tensor.hpp"
#include "core/time_interval.hpp"

#include <expected>
#include <string>
#include <vector>

namespace experanto::modules {

enum class InterpolatorError {
    MetadataNotFound,
    MetadataInvalid,
    UnknownModality,
    UnknownFrameModality,
    DataNotFound,
    DataShapeMismatch,
    ImageSizeMismatch,
    FrameCountMismatch,
    UnsortedTimestamps,
    UnsortedTimes,
    FrameIndexOutOfRange
};

std::string error_to_string(InterpolatorError err);

// Result of one interpolate() call. `values` holds one entry along axis 0 per
// true position of `valid`, in input order.
struct Interpolation {
    core::Tensor values;
    std::vector<bool> valid;
};

class Interpolator {
public:
    virtual ~Interpolator() = default;

    Interpolator(const Interpolator&) = delete;
    Interpolator& operator=(const Interpolator&) = delete;

    virtual std::expected<Interpolation, InterpolatorError> interpolate(const std::vector<double>& times) const = 0;
    virtual std::string modality() const = 0;

    std::vector<bool> valid_times(const std::vector<double>& times) const;

    // True if any of the times falls inside the valid interval
    bool contains(const std::vector<double>& times) const;

    const std::string& root_folder() const { return root_folder_; }
    double start_time() const { return start_time_; }
    double end_time() const { return end_time_; }
    const core::TimeInterval& valid_interval() const { return valid_interval_; }
    const core::Metadata& metadata() const { return meta_; }

protected:
    Interpolator() = default;

    // Reads start/end time from the recording metadata; valid interval starts
    // out as [start_time, end_time).
    std::expected<void, InterpolatorError> init_common(const std::string& root_folder, const core::Metadata& meta);

    static std::vector<double> select_valid(const std::vector<double>& times, const std::vector<bool>& valid);

    std::string root_folder_;
    core::Metadata meta_;
    double start_time_ = 0.0;
    double end_time_ = 0.0;
    core::TimeInterval valid_interval_;
};

// Loads <root_folder>/meta.yml
std::expected<core::Metadata, InterpolatorError> load_recording_metadata(const std::string& root_folder);

} // namespace experanto::modules
