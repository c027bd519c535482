#include "core/metadata.hpp"

#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <fstream>
#include <iostream>

namespace experanto::core {

namespace {

nlohmann::json scalar_to_json(const YAML::Node& node) {
    const std::string& text = node.Scalar();
    // Quoted scalars carry the non-specific "!" tag and always stay strings
    if (node.Tag() == "!") return text;

    if (text == "true" || text == "True" || text == "TRUE") return true;
    if (text == "false" || text == "False" || text == "FALSE") return false;

    long long as_int = 0;
    if (YAML::convert<long long>::decode(node, as_int)) return as_int;

    double as_double = 0.0;
    if (YAML::convert<double>::decode(node, as_double)) return as_double;

    return text;
}

nlohmann::json yaml_to_json(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Scalar:
            return scalar_to_json(node);
        case YAML::NodeType::Sequence: {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto& item : node) {
                arr.push_back(yaml_to_json(item));
            }
            return arr;
        }
        case YAML::NodeType::Map: {
            nlohmann::json obj = nlohmann::json::object();
            for (const auto& kv : node) {
                obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
            }
            return obj;
        }
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
        default:
            return nullptr;
    }
}

void emit_json(YAML::Emitter& out, const nlohmann::json& value) {
    if (value.is_object()) {
        out << YAML::BeginMap;
        for (auto it = value.begin(); it != value.end(); ++it) {
            out << YAML::Key << it.key() << YAML::Value;
            emit_json(out, it.value());
        }
        out << YAML::EndMap;
    } else if (value.is_array()) {
        out << YAML::Flow << YAML::BeginSeq;
        for (const auto& item : value) {
            emit_json(out, item);
        }
        out << YAML::EndSeq;
    } else if (value.is_boolean()) {
        out << value.get<bool>();
    } else if (value.is_number_integer()) {
        out << value.get<int64_t>();
    } else if (value.is_number_float()) {
        out << YAML::Precision(17) << value.get<double>();
    } else if (value.is_string()) {
        out << value.get<std::string>();
    } else {
        out << YAML::Null;
    }
}

} // namespace

std::string error_to_string(MetadataError err) {
    switch (err) {
        case MetadataError::FileNotFound: return "FileNotFound";
        case MetadataError::ParseError: return "ParseError";
        case MetadataError::UnsupportedFormat: return "UnsupportedFormat";
        case MetadataError::MissingField: return "MissingField";
        case MetadataError::WrongType: return "WrongType";
        case MetadataError::WriteFailed: return "WriteFailed";
        default: return "Unknown Error";
    }
}

std::expected<Metadata, MetadataError> load_metadata(const std::string& filepath) {
    if (!std::filesystem::is_regular_file(filepath)) {
        std::cerr << "[Meta] Metadata not found: " << filepath << "\n";
        return std::unexpected(MetadataError::FileNotFound);
    }

    Metadata meta;
    if (filepath.ends_with(".yml") || filepath.ends_with(".yaml")) {
        try {
            meta = yaml_to_json(YAML::LoadFile(filepath));
        } catch (const YAML::Exception& e) {
            std::cerr << "[Meta] YAML Parse Error in " << filepath << ": " << e.what() << "\n";
            return std::unexpected(MetadataError::ParseError);
        }
    } else if (filepath.ends_with(".json")) {
        std::ifstream in(filepath);
        try {
            in >> meta;
        } catch (const nlohmann::json::parse_error& e) {
            std::cerr << "[Meta] JSON Parse Error in " << filepath << ": " << e.what() << "\n";
            return std::unexpected(MetadataError::ParseError);
        }
    } else {
        std::cerr << "[Meta] Unsupported metadata format: " << filepath << "\n";
        return std::unexpected(MetadataError::UnsupportedFormat);
    }

    if (!meta.is_object()) {
        std::cerr << "[Meta] Top level of " << filepath << " is not a mapping\n";
        return std::unexpected(MetadataError::ParseError);
    }
    return meta;
}

std::expected<void, MetadataError> save_metadata(const std::string& filepath, const Metadata& metadata) {
    YAML::Emitter out;
    emit_json(out, metadata);

    std::ofstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "[Meta] Failed to open " << filepath << " for writing\n";
        return std::unexpected(MetadataError::WriteFailed);
    }
    file << out.c_str() << "\n";
    if (!file) return std::unexpected(MetadataError::WriteFailed);
    return {};
}

std::expected<double, MetadataError> require_number(const Metadata& meta, const std::string& key) {
    if (!meta.contains(key)) return std::unexpected(MetadataError::MissingField);
    if (!meta[key].is_number()) return std::unexpected(MetadataError::WrongType);
    return meta[key].get<double>();
}

std::expected<int64_t, MetadataError> require_integer(const Metadata& meta, const std::string& key) {
    if (!meta.contains(key)) return std::unexpected(MetadataError::MissingField);
    if (!meta[key].is_number_integer()) return std::unexpected(MetadataError::WrongType);
    return meta[key].get<int64_t>();
}

std::expected<bool, MetadataError> require_bool(const Metadata& meta, const std::string& key) {
    if (!meta.contains(key)) return std::unexpected(MetadataError::MissingField);
    if (!meta[key].is_boolean()) return std::unexpected(MetadataError::WrongType);
    return meta[key].get<bool>();
}

std::expected<std::string, MetadataError> require_string(const Metadata& meta, const std::string& key) {
    if (!meta.contains(key)) return std::unexpected(MetadataError::MissingField);
    if (!meta[key].is_string()) return std::unexpected(MetadataError::WrongType);
    return meta[key].get<std::string>();
}

} // namespace experanto::core
