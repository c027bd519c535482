#include "modules/config_module.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <fstream>
#include <iostream>

namespace experanto::modules {

std::string error_to_string(ConfigError err) {
    switch (err) {
        case ConfigError::FileNotFound: return "FileNotFound";
        case ConfigError::ParseError: return "ParseError";
        default: return "Unknown Error";
    }
}

void ConfigModule::save_config(const ProbeConfig& config, const std::string& filepath) {
    nlohmann::json j;

    j["recordings"] = config.recordings;
    if (config.times.values.empty()) {
        j["times"] = {
            {"start", config.times.start},
            {"stop", config.times.stop},
            {"step", config.times.step}
        };
    } else {
        j["times"]["values"] = config.times.values;
    }
    if (!config.export_dir.empty()) {
        j["export_dir"] = config.export_dir;
    }
    j["print_limit"] = config.print_limit;

    std::ofstream out(filepath);
    if (out.is_open()) {
        out << j.dump(4);
    } else {
        std::cerr << "[Config] Could not write " << filepath << "\n";
    }
}

std::expected<ProbeConfig, ConfigError> ConfigModule::load_or_create_config(const std::string& filepath) {
    ProbeConfig config;

    std::ifstream in(filepath);
    if (!in.is_open()) {
        std::cout << "[Config] Config not found at " << filepath << ". Generating default config.\n";
        config.recordings = {"recordings/screen", "recordings/sequence"};
        save_config(config, filepath);
        return config;
    }

    try {
        nlohmann::json j;
        in >> j;

        if (j.contains("recordings") && j["recordings"].is_array()) {
            for (const auto& item : j["recordings"]) {
                if (item.is_string()) config.recordings.push_back(item);
            }
        }

        if (j.contains("times")) {
            const auto& times_json = j["times"];
            if (times_json.contains("values") && times_json["values"].is_array()) {
                for (const auto& item : times_json["values"]) {
                    if (item.is_number()) config.times.values.push_back(item.get<double>());
                }
            }
            config.times.start = times_json.value("start", 0.0);
            config.times.stop = times_json.value("stop", 10.0);
            config.times.step = times_json.value("step", 0.1);
        }

        config.export_dir = j.value("export_dir", "");
        config.print_limit = j.value("print_limit", 5);

    } catch (const nlohmann::json::parse_error& e) {
        std::cerr << "[Config] Parse Error: " << e.what() << "\n";
        return std::unexpected(ConfigError::ParseError);
    } catch (const std::exception& e) {
        std::cerr << "[Config] Parse Error: " << e.what() << "\n";
        return std::unexpected(ConfigError::ParseError);
    }

    return config;
}

std::vector<double> ConfigModule::query_times(const TimeGridConfig& grid) {
    if (!grid.values.empty()) return grid.values;

    std::vector<double> times;
    if (grid.step <= 0.0 || grid.stop <= grid.start) return times;

    // Index-based so the grid does not accumulate rounding error
    auto count = static_cast<size_t>(std::ceil((grid.stop - grid.start) / grid.step));
    times.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        double t = grid.start + static_cast<double>(i) * grid.step;
        if (t >= grid.stop) break;
        times.push_back(t);
    }
    return times;
}

} // namespace experanto::modules
