#include "core/npy_io.hpp"

#include <cstdint>
#include <cstring>
#include <fstream>
#include <iostream>
#include <limits>
#include <optional>
#include <unordered_map>

namespace experanto::core {

namespace {

constexpr char kMagic[] = "\x93NUMPY";
constexpr size_t kMagicLen = 6;

struct DType {
    char kind = 0;       // 'f', 'i', 'u', 'b'
    size_t itemsize = 0;
};

std::expected<DType, ArrayError> parse_descr(const std::string& descr) {
    if (descr.size() < 3) return std::unexpected(ArrayError::UnsupportedFormat);

    char order = descr[0];
    DType dt;
    dt.kind = descr[1];
    try {
        dt.itemsize = std::stoul(descr.substr(2));
    } catch (const std::exception&) {
        return std::unexpected(ArrayError::UnsupportedFormat);
    }

    if (order == '>' && dt.itemsize > 1) {
        std::cerr << "[Array] Big-endian arrays are not supported: " << descr << "\n";
        return std::unexpected(ArrayError::UnsupportedFormat);
    }
    if (order != '<' && order != '|' && order != '=' && order != '>') {
        return std::unexpected(ArrayError::UnsupportedFormat);
    }

    bool ok = false;
    switch (dt.kind) {
        case 'f': ok = dt.itemsize == 4 || dt.itemsize == 8; break;
        case 'i':
        case 'u': ok = dt.itemsize == 1 || dt.itemsize == 2 || dt.itemsize == 4 || dt.itemsize == 8; break;
        case 'b': ok = dt.itemsize == 1; break;
        default: break;
    }
    if (!ok) {
        std::cerr << "[Array] Unsupported dtype: " << descr << "\n";
        return std::unexpected(ArrayError::UnsupportedFormat);
    }
    return dt;
}

template <typename T>
void widen(const char* src, size_t count, double* dst) {
    for (size_t i = 0; i < count; ++i) {
        T v;
        std::memcpy(&v, src + i * sizeof(T), sizeof(T));
        dst[i] = static_cast<double>(v);
    }
}

void convert(const DType& dt, const char* src, size_t count, double* dst) {
    switch (dt.kind) {
        case 'f':
            if (dt.itemsize == 8) widen<double>(src, count, dst);
            else widen<float>(src, count, dst);
            break;
        case 'i':
            if (dt.itemsize == 8) widen<int64_t>(src, count, dst);
            else if (dt.itemsize == 4) widen<int32_t>(src, count, dst);
            else if (dt.itemsize == 2) widen<int16_t>(src, count, dst);
            else widen<int8_t>(src, count, dst);
            break;
        case 'u':
            if (dt.itemsize == 8) widen<uint64_t>(src, count, dst);
            else if (dt.itemsize == 4) widen<uint32_t>(src, count, dst);
            else if (dt.itemsize == 2) widen<uint16_t>(src, count, dst);
            else widen<uint8_t>(src, count, dst);
            break;
        case 'b':
            widen<uint8_t>(src, count, dst);
            for (size_t i = 0; i < count; ++i) dst[i] = dst[i] != 0.0 ? 1.0 : 0.0;
            break;
    }
}

// Pulls the quoted value following `'key':` out of the header dict.
std::string header_value(const std::string& header, const std::string& key) {
    auto pos = header.find("'" + key + "'");
    if (pos == std::string::npos) return "";
    pos = header.find(':', pos);
    if (pos == std::string::npos) return "";
    ++pos;
    while (pos < header.size() && header[pos] == ' ') ++pos;
    if (pos >= header.size()) return "";

    if (header[pos] == '\'') {
        auto end = header.find('\'', pos + 1);
        return end == std::string::npos ? "" : header.substr(pos + 1, end - pos - 1);
    }
    if (header[pos] == '(') {
        auto end = header.find(')', pos);
        return end == std::string::npos ? "" : header.substr(pos, end - pos + 1);
    }
    auto end = header.find_first_of(",}", pos);
    return header.substr(pos, end - pos);
}

std::expected<Shape, ArrayError> parse_shape(const std::string& text) {
    if (text.size() < 2 || text.front() != '(' || text.back() != ')') {
        return std::unexpected(ArrayError::InvalidHeader);
    }
    Shape shape;
    std::string token;
    auto flush = [&]() -> bool {
        if (token.empty()) return true;
        try {
            unsigned long long dim = std::stoull(token);
            if (dim > std::numeric_limits<size_t>::max()) return false;
            shape.push_back(static_cast<size_t>(dim));
        } catch (const std::exception&) {
            return false;
        }
        token.clear();
        return true;
    };
    for (char c : text.substr(1, text.size() - 2)) {
        if (c == ',') {
            if (!flush()) return std::unexpected(ArrayError::InvalidHeader);
        } else if (c >= '0' && c <= '9') {
            token += c;
        } else if (c != ' ' && c != 'L') {
            return std::unexpected(ArrayError::InvalidHeader);
        }
    }
    if (!flush()) return std::unexpected(ArrayError::InvalidHeader);
    return shape;
}

// Bytes left between the current read position and the end of the stream.
std::optional<uint64_t> remaining_bytes(std::istream& in) {
    auto here = in.tellg();
    if (here < 0) return std::nullopt;
    in.seekg(0, std::ios::end);
    auto end = in.tellg();
    in.seekg(here);
    if (end < here || !in) return std::nullopt;
    return static_cast<uint64_t>(end - here);
}

std::expected<Tensor, ArrayError> read_payload(std::istream& in, const DType& dt, const Shape& shape, const std::string& filepath) {
    size_t count = 1;
    for (size_t dim : shape) {
        if (dim != 0 && count > std::numeric_limits<size_t>::max() / dim) {
            std::cerr << "[Array] Shape " << shape_to_string(shape) << " overflows in " << filepath << "\n";
            return std::unexpected(ArrayError::InvalidHeader);
        }
        count *= dim;
    }
    if (count > std::numeric_limits<size_t>::max() / dt.itemsize) {
        std::cerr << "[Array] Shape " << shape_to_string(shape) << " overflows in " << filepath << "\n";
        return std::unexpected(ArrayError::InvalidHeader);
    }
    size_t bytes = count * dt.itemsize;

    auto left = remaining_bytes(in);
    if (!left || *left < bytes) {
        std::cerr << "[Array] Truncated payload in " << filepath << ": expected " << bytes
                  << " bytes, got " << (left ? *left : 0) << "\n";
        return std::unexpected(ArrayError::Truncated);
    }

    std::vector<char> raw(bytes);
    in.read(raw.data(), static_cast<std::streamsize>(raw.size()));
    if (static_cast<size_t>(in.gcount()) != raw.size()) {
        std::cerr << "[Array] Truncated payload in " << filepath << ": expected " << raw.size()
                  << " bytes, got " << in.gcount() << "\n";
        return std::unexpected(ArrayError::Truncated);
    }

    std::vector<double> values(count);
    convert(dt, raw.data(), count, values.data());
    return Tensor(shape, std::move(values));
}

} // namespace

std::string error_to_string(ArrayError err) {
    switch (err) {
        case ArrayError::FileNotFound: return "FileNotFound";
        case ArrayError::InvalidHeader: return "InvalidHeader";
        case ArrayError::UnsupportedFormat: return "UnsupportedFormat";
        case ArrayError::Truncated: return "Truncated";
        case ArrayError::WriteFailed: return "WriteFailed";
        default: return "Unknown Error";
    }
}

std::expected<Tensor, ArrayError> load_npy(const std::string& filepath) {
    std::ifstream in(filepath, std::ios::binary);
    if (!in.is_open()) {
        std::cerr << "[Array] Failed to open " << filepath << "\n";
        return std::unexpected(ArrayError::FileNotFound);
    }

    char preamble[kMagicLen + 2];
    in.read(preamble, sizeof(preamble));
    if (in.gcount() != static_cast<std::streamsize>(sizeof(preamble)) ||
        std::memcmp(preamble, kMagic, kMagicLen) != 0) {
        std::cerr << "[Array] Not a .npy file: " << filepath << "\n";
        return std::unexpected(ArrayError::InvalidHeader);
    }

    uint8_t major = static_cast<uint8_t>(preamble[kMagicLen]);
    uint32_t header_len = 0;
    if (major == 1) {
        uint8_t len_bytes[2];
        in.read(reinterpret_cast<char*>(len_bytes), 2);
        header_len = len_bytes[0] | (len_bytes[1] << 8);
    } else if (major == 2 || major == 3) {
        uint8_t len_bytes[4];
        in.read(reinterpret_cast<char*>(len_bytes), 4);
        header_len = len_bytes[0] | (len_bytes[1] << 8) | (len_bytes[2] << 16) | (static_cast<uint32_t>(len_bytes[3]) << 24);
    } else {
        std::cerr << "[Array] Unknown .npy version " << static_cast<int>(major) << " in " << filepath << "\n";
        return std::unexpected(ArrayError::UnsupportedFormat);
    }
    if (!in) return std::unexpected(ArrayError::InvalidHeader);

    auto left = remaining_bytes(in);
    if (!left || *left < header_len) {
        std::cerr << "[Array] Truncated header in " << filepath << "\n";
        return std::unexpected(ArrayError::InvalidHeader);
    }

    std::string header(header_len, '\0');
    in.read(header.data(), header_len);
    if (static_cast<uint32_t>(in.gcount()) != header_len) {
        return std::unexpected(ArrayError::InvalidHeader);
    }

    if (header_value(header, "fortran_order") != "False") {
        std::cerr << "[Array] Fortran-ordered arrays are not supported: " << filepath << "\n";
        return std::unexpected(ArrayError::UnsupportedFormat);
    }

    auto dt = parse_descr(header_value(header, "descr"));
    if (!dt) return std::unexpected(dt.error());

    auto shape = parse_shape(header_value(header, "shape"));
    if (!shape) {
        std::cerr << "[Array] Malformed shape in " << filepath << "\n";
        return std::unexpected(shape.error());
    }

    return read_payload(in, *dt, *shape, filepath);
}

std::expected<Tensor, ArrayError> load_raw(const std::string& filepath, const std::string& dtype, const Shape& shape) {
    static const std::unordered_map<std::string, std::string> kNames = {
        {"float64", "<f8"}, {"float32", "<f4"},
        {"int64", "<i8"}, {"int32", "<i4"}, {"int16", "<i2"}, {"int8", "|i1"},
        {"uint64", "<u8"}, {"uint32", "<u4"}, {"uint16", "<u2"}, {"uint8", "|u1"},
        {"bool", "|b1"}
    };

    auto it = kNames.find(dtype);
    if (it == kNames.end()) {
        std::cerr << "[Array] Unknown raw dtype '" << dtype << "' for " << filepath << "\n";
        return std::unexpected(ArrayError::UnsupportedFormat);
    }
    auto dt = parse_descr(it->second);
    if (!dt) return std::unexpected(dt.error());

    std::ifstream in(filepath, std::ios::binary);
    if (!in.is_open()) {
        std::cerr << "[Array] Failed to open " << filepath << "\n";
        return std::unexpected(ArrayError::FileNotFound);
    }
    return read_payload(in, *dt, shape, filepath);
}

std::expected<void, ArrayError> save_npy(const std::string& filepath, const Tensor& tensor) {
    std::string header = "{'descr': '<f8', 'fortran_order': False, 'shape': " + shape_to_string(tensor.shape()) + ", }";
    // Magic + version + length field + header + '\n' must be a multiple of 64
    size_t total = kMagicLen + 2 + 2 + header.size() + 1;
    header.append((64 - total % 64) % 64, ' ');
    header += '\n';

    std::ofstream out(filepath, std::ios::binary);
    if (!out.is_open()) {
        std::cerr << "[Array] Failed to open " << filepath << " for writing\n";
        return std::unexpected(ArrayError::WriteFailed);
    }

    out.write(kMagic, kMagicLen);
    const char version[2] = {1, 0};
    out.write(version, 2);
    const char len_bytes[2] = {static_cast<char>(header.size() & 0xFF), static_cast<char>((header.size() >> 8) & 0xFF)};
    out.write(len_bytes, 2);
    out.write(header.data(), static_cast<std::streamsize>(header.size()));
    out.write(reinterpret_cast<const char*>(tensor.data()), static_cast<std::streamsize>(tensor.size() * sizeof(double)));

    if (!out) return std::unexpected(ArrayError::WriteFailed);
    return {};
}

} // namespace experanto::core
