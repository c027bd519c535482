#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "modules/config_module.hpp"
#include "modules/config_validator.hpp"
#include "modules/frame_exporter.hpp"
#include "modules/interpolator_factory.hpp"
#include "modules/screen_interpolator.hpp"

using namespace experanto;

namespace {

constexpr size_t kMaxPrintedValues = 6;

std::string format_row(const core::Tensor& values, size_t row) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(4);
    const double* data = values.frame(row);
    const size_t n = values.frame_size();
    for (size_t i = 0; i < n && i < kMaxPrintedValues; ++i) {
        ss << (i == 0 ? "" : " ") << data[i];
    }
    if (n > kMaxPrintedValues) ss << " ... (" << n << " values)";
    return ss.str();
}

// Writes every returned frame of a screen recording as <export_dir>/<name>_<n>.png
void export_frames(const modules::ScreenInterpolator& screen, const modules::Interpolation& result,
                   const std::string& export_dir) {
    std::error_code ec;
    std::filesystem::create_directories(export_dir, ec);
    if (ec) {
        std::cerr << "[Probe] Cannot create export directory " << export_dir << ": " << ec.message() << "\n";
        return;
    }

    std::string name = std::filesystem::path(screen.root_folder()).filename().string();
    size_t written = 0;
    for (size_t i = 0; i < result.values.shape()[0]; ++i) {
        auto path = (std::filesystem::path(export_dir) / (name + "_" + std::to_string(i) + ".png")).string();
        if (auto res = modules::FrameExporter::save_png(path, result.values.frame(i), screen.image_size()); !res) {
            std::cerr << "[Probe] Frame export stopped: " << modules::error_to_string(res.error()) << "\n";
            break;
        }
        ++written;
    }
    std::cout << "[Probe] Exported " << written << " frames to " << export_dir << "\n";
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path = "probe.json";
    if (argc > 1) {
        config_path = argv[1];
    }

    std::cout << "Starting Experanto Probe...\n";

    // 1. Load Configuration
    modules::ConfigModule config_module;
    auto config_res = config_module.load_or_create_config(config_path);
    if (!config_res) {
        std::cerr << "[Probe] Fatal Config Error: " << modules::error_to_string(config_res.error()) << "\n";
        return 1;
    }
    const auto& config = config_res.value();

    // 2. Validate Configuration
    auto config_errors = modules::ConfigValidator::validate(config);
    if (!config_errors.empty()) {
        std::cerr << "[Config] " << config_errors.size() << " validation error(s):\n";
        for (const auto& err : config_errors) {
            std::cerr << "  - " << err << "\n";
        }
        return 1;
    }

    auto times = modules::ConfigModule::query_times(config.times);
    std::cout << "[Probe] " << times.size() << " query times\n";

    // 3. Interpolate every recording on the shared timeline
    modules::InterpolatorFactory factory;
    int failures = 0;
    for (const auto& root : config.recordings) {
        auto interp = factory.create(root);
        if (!interp) {
            std::cerr << "[Probe] Cannot open " << root << ": " << modules::error_to_string(interp.error()) << "\n";
            ++failures;
            continue;
        }

        auto result = (*interp)->interpolate(times);
        if (!result) {
            std::cerr << "[Probe] Interpolation failed for " << root << ": "
                      << modules::error_to_string(result.error()) << "\n";
            ++failures;
            continue;
        }

        const auto& values = result->values;
        std::cout << "[Probe] " << root << " (" << (*interp)->modality() << "): "
                  << values.shape()[0] << "/" << times.size() << " valid, shape "
                  << core::shape_to_string(values.shape()) << "\n";

        size_t row = 0;
        for (size_t i = 0; i < times.size() && row < static_cast<size_t>(config.print_limit); ++i) {
            if (!result->valid[i]) continue;
            std::cout << "  t=" << times[i] << ": " << format_row(values, row) << "\n";
            ++row;
        }

        if (!config.export_dir.empty()) {
            if (auto* screen = dynamic_cast<modules::ScreenInterpolator*>(interp->get())) {
                export_frames(*screen, *result, config.export_dir);
            }
        }
    }

    if (failures > 0) {
        std::cerr << "[Probe] " << failures << " recording(s) failed\n";
        return 1;
    }
    return 0;
}
