#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace experanto::core {

using Shape = std::vector<size_t>;

// Dense row-major array of doubles. Axis 0 is the sample/frame axis.
class Tensor {
public:
    Tensor() = default;
    explicit Tensor(Shape shape);
    Tensor(Shape shape, std::vector<double> values);

    const Shape& shape() const { return shape_; }
    size_t rank() const { return shape_.size(); }
    size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }

    // Elements per slice along axis 0 (1 for a vector)
    size_t frame_size() const;
    Shape frame_shape() const;

    double* frame(size_t i) { return this->values_.data() + i * frame_size(); }
    const double* frame(size_t i) const { return this->values_.data() + i * frame_size(); }

    double& at(size_t row, size_t col) { return this->values_[row * frame_size() + col]; }
    double at(size_t row, size_t col) const { return this->values_[row * frame_size() + col]; }

    double& operator[](size_t i) { return this->values_[i]; }
    double operator[](size_t i) const { return this->values_[i]; }

    double* data() { return this->values_.data(); }
    const double* data() const { return this->values_.data(); }
    const std::vector<double>& values() const { return values_; }

    bool operator==(const Tensor& other) const = default;

private:
    Shape shape_;
    std::vector<double> values_;
};

size_t shape_size(const Shape& shape);
std::string shape_to_string(const Shape& shape);

} // namespace experanto::core
