#pragma once

#include "modules/interpolator.hpp"

#include <expected>
#include <memory>
#include <string>
#include <vector>

namespace experanto::modules {

// Nearest-sample lookup into a uniformly sampled multi-channel trace
// (data.npy, [num_samples, num_signals]) with an optional constant time
// offset per channel (meta/phase_shifts.npy).
class SequenceInterpolator : public Interpolator {
public:
    static std::expected<std::unique_ptr<SequenceInterpolator>, InterpolatorError> create(const std::string& root_folder);
    static std::expected<std::unique_ptr<SequenceInterpolator>, InterpolatorError> create(const std::string& root_folder,
                                                                                          const core::Metadata& meta);

    ~SequenceInterpolator() override = default;

    // values has shape (num_valid, num_signals)
    std::expected<Interpolation, InterpolatorError> interpolate(const std::vector<double>& times) const override;
    std::string modality() const override { return "sequence"; }

    size_t num_signals() const { return data_.shape()[1]; }
    size_t num_samples() const { return data_.shape()[0]; }
    double sampling_rate() const { return 1.0 / time_delta_; }
    double time_delta() const { return time_delta_; }
    bool uses_phase_shifts() const { return use_phase_shifts_; }
    const std::vector<double>& phase_shifts() const { return phase_shifts_; }

private:
    SequenceInterpolator() = default;

    std::expected<void, InterpolatorError> init_data();
    std::expected<void, InterpolatorError> init_phase_shifts();
    std::expected<void, InterpolatorError> check_coverage() const;
    double sample_position(double time, double shift) const;

    double time_delta_ = 1.0;
    bool use_phase_shifts_ = false;
    std::vector<double> phase_shifts_;  // one per signal, zeros when disabled
    core::Tensor data_;
};

} // namespace experanto::modules
