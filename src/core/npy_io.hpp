#pragma once

#include "core/tensor.hpp"

#include <expected>
#include <string>

namespace experanto::core {

enum class ArrayError {
    FileNotFound,
    InvalidHeader,
    UnsupportedFormat,
    Truncated,
    WriteFailed
};

std::string error_to_string(ArrayError err);

// Reads a NumPy .npy file (format versions 1-3, C order). Every supported
// dtype is widened to double.
std::expected<Tensor, ArrayError> load_npy(const std::string& filepath);

// Reads a header-less dump as written by numpy.memmap. `dtype` takes NumPy
// names ("float64", "uint8", ...).
std::expected<Tensor, ArrayError> load_raw(const std::string& filepath, const std::string& dtype, const Shape& shape);

// Writes a version 1.0 '<f8' file.
std::expected<void, ArrayError> save_npy(const std::string& filepath, const Tensor& tensor);

} // namespace experanto::core
