#include "core/tensor.hpp"

#include <functional>
#include <numeric>
#include <stdexcept>
#include <utility>

namespace experanto::core {

Tensor::Tensor(Shape shape)
    : shape_(std::move(shape)), values_(shape_size(shape_), 0.0) {}

Tensor::Tensor(Shape shape, std::vector<double> values)
    : shape_(std::move(shape)), values_(std::move(values)) {
    if (this->values_.size() != shape_size(this->shape_)) {
        throw std::invalid_argument("Tensor: " + std::to_string(this->values_.size()) +
                                    " values do not fit shape " + shape_to_string(this->shape_));
    }
}

size_t Tensor::frame_size() const {
    if (this->shape_.size() <= 1) return 1;
    return std::accumulate(this->shape_.begin() + 1, this->shape_.end(), size_t{1}, std::multiplies<>());
}

Shape Tensor::frame_shape() const {
    if (this->shape_.empty()) return {};
    return Shape(this->shape_.begin() + 1, this->shape_.end());
}

size_t shape_size(const Shape& shape) {
    return std::accumulate(shape.begin(), shape.end(), size_t{1}, std::multiplies<>());
}

std::string shape_to_string(const Shape& shape) {
    std::string out = "(";
    for (size_t i = 0; i < shape.size(); ++i) {
        if (i > 0) out += ", ";
        out += std::to_string(shape[i]);
    }
    if (shape.size() == 1) out += ",";
    out += ")";
    return out;
}

} // namespace experanto::core
