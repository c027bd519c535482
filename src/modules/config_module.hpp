#pragma once

#include <expected>
#include <string>
#include <vector>

namespace experanto::modules {

enum class ConfigError {
    FileNotFound,
    ParseError
};

std::string error_to_string(ConfigError err);

// Query timeline: explicit `values` win over the [start, stop) grid
struct TimeGridConfig {
    double start = 0.0;
    double stop = 10.0;
    double step = 0.1;
    std::vector<double> values;
};

struct ProbeConfig {
    std::vector<std::string> recordings;
    TimeGridConfig times;
    std::string export_dir;  // empty = no PNG export
    int print_limit = 5;
};

class ConfigModule {
public:
    ConfigModule() = default;
    ~ConfigModule() = default;

    std::expected<ProbeConfig, ConfigError> load_or_create_config(const std::string& filepath);

    static std::vector<double> query_times(const TimeGridConfig& grid);

private:
    void save_config(const ProbeConfig& config, const std::string& filepath);
};

} // namespace experanto::modules
