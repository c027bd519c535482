#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <expected>
#include <string>

namespace experanto::core {

// Recording-level attributes loaded from meta.yml (or any chunk metadata file)
using Metadata = nlohmann::json;

enum class MetadataError {
    FileNotFound,
    ParseError,
    UnsupportedFormat,
    MissingField,
    WrongType,
    WriteFailed
};

std::string error_to_string(MetadataError err);

std::expected<Metadata, MetadataError> load_metadata(const std::string& filepath);
std::expected<void, MetadataError> save_metadata(const std::string& filepath, const Metadata& metadata);

// Typed access to required keys
std::expected<double, MetadataError> require_number(const Metadata& meta, const std::string& key);
std::expected<int64_t, MetadataError> require_integer(const Metadata& meta, const std::string& key);
std::expected<bool, MetadataError> require_bool(const Metadata& meta, const std::string& key);
std::expected<std::string, MetadataError> require_string(const Metadata& meta, const std::string& key);

} // namespace experanto::core
