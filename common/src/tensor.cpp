#include "t5backbone/tensor.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace t5backbone {

Tensor::Tensor() = default;

Tensor::Tensor(const std::vector<int>& shape_in, float fill_value)
    : shape(shape_in), data(numel(shape_in), fill_value) {}

Tensor::Tensor(const std::vector<int>& shape_in, std::vector<float> values)
    : shape(shape_in), data(std::move(values))
{
    if (static_cast<int>(data.size()) != numel(shape))
        throw std::runtime_error("Tensor: " + std::to_string(data.size()) +
                                 " values do not fill shape " + shape_string());
}

int Tensor::numel(const std::vector<int>& shape_in)
{
    int total_elements = 1;
    for (int dimension_size : shape_in) {
        if (dimension_size < 0)
            throw std::runtime_error("Tensor: negative dimension");
        total_elements *= dimension_size;
    }
    return total_elements;
}

Tensor Tensor::zeros(const std::vector<int>& shape_in)
{
    return Tensor(shape_in, 0.0f);
}

Tensor Tensor::ones(const std::vector<int>& shape_in)
{
    return Tensor(shape_in, 1.0f);
}

Tensor Tensor::randn(const std::vector<int>& shape_in, float mean, float stddev, std::mt19937& rng)
{
    Tensor output_tensor(shape_in);
    std::normal_distribution<float> dist(mean, stddev);
    for (float& value : output_tensor.data)
        value = dist(rng);
    return output_tensor;
}

Tensor Tensor::truncated_normal(const std::vector<int>& shape_in, float mean, float stddev, std::mt19937& rng)
{
    Tensor output_tensor(shape_in);
    std::normal_distribution<float> dist(mean, stddev);
    const float bound = 2.0f * stddev;
    for (float& value : output_tensor.data) {
        float sample = dist(rng);
        while (std::fabs(sample - mean) > bound)
            sample = dist(rng);
        value = sample;
    }
    return output_tensor;
}

int Tensor::size() const
{
    return static_cast<int>(data.size());
}

int Tensor::dim(int axis) const
{
    if (axis < 0)
        axis += rank();
    if (axis < 0 || axis >= rank())
        throw std::runtime_error("dim: axis out of range for shape " + shape_string());
    return shape[axis];
}

Tensor Tensor::reshape(const std::vector<int>& new_shape) const
{
    if (numel(new_shape) != size())
        throw std::runtime_error("reshape: size mismatch");

    Tensor reshaped_tensor = *this;
    reshaped_tensor.shape = new_shape;
    return reshaped_tensor;
}

std::vector<int> Tensor::compute_strides(const std::vector<int>& shape_in)
{
    std::vector<int> strides(shape_in.size());
    int running_product = 1;

    for (size_t idx = shape_in.size(); idx-- > 0;) {
        strides[idx] = running_product;
        running_product *= shape_in[idx];
    }
    return strides;
}

Tensor Tensor::permute(const std::vector<int>& new_axis_order) const
{
    if (new_axis_order.size() != shape.size())
        throw std::runtime_error("permute: wrong dims");

    std::vector<int> permuted_shape(shape.size());
    for (size_t idx = 0; idx < new_axis_order.size(); idx++) {
        if (new_axis_order[idx] < 0 || new_axis_order[idx] >= rank())
            throw std::runtime_error("permute: axis out of range");
        permuted_shape[idx] = shape[new_axis_order[idx]];
    }

    Tensor output_tensor(permuted_shape, 0.0f);

    auto input_strides = compute_strides(shape);
    auto output_strides = compute_strides(permuted_shape);
    std::vector<int> coord(shape.size());

    for (int flat_idx = 0; flat_idx < size(); flat_idx++) {
        int remaining_idx = flat_idx;

        for (size_t dim = 0; dim < shape.size(); dim++) {
            coord[dim] = remaining_idx / input_strides[dim];
            remaining_idx %= input_strides[dim];
        }

        int output_flat_idx = 0;
        for (size_t dim = 0; dim < shape.size(); dim++)
            output_flat_idx += coord[new_axis_order[dim]] * output_strides[dim];

        output_tensor.data[output_flat_idx] = data[flat_idx];
    }

    return output_tensor;
}

Tensor Tensor::transpose() const
{
    if (shape.size() != 2)
        throw std::runtime_error("transpose: only 2D supported");

    return permute({1, 0});
}

Tensor Tensor::operator+(const Tensor& other) const
{
    if (shape != other.shape)
        throw std::runtime_error("operator+: shape mismatch " + shape_string() +
                                 " vs " + other.shape_string());

    Tensor output_tensor(shape);
    for (int idx = 0; idx < size(); idx++)
        output_tensor.data[idx] = data[idx] + other.data[idx];

    return output_tensor;
}

Tensor Tensor::operator*(const Tensor& other) const
{
    if (shape != other.shape)
        throw std::runtime_error("operator*: shape mismatch " + shape_string() +
                                 " vs " + other.shape_string());

    Tensor output_tensor(shape);
    for (int idx = 0; idx < size(); idx++)
        output_tensor.data[idx] = data[idx] * other.data[idx];

    return output_tensor;
}

Tensor Tensor::operator*(float scalar) const
{
    Tensor output_tensor = *this;
    for (float& value : output_tensor.data)
        value *= scalar;
    return output_tensor;
}

Tensor Tensor::softmax(int axis) const
{
    if (axis < 0)
        axis += static_cast<int>(shape.size());
    if (axis < 0 || axis >= rank())
        throw std::runtime_error("softmax: axis out of range");

    Tensor output_tensor = *this;

    int axis_dim_size = shape[axis];
    if (axis_dim_size == 0 || size() == 0)
        return output_tensor;

    int inner_stride = 1;
    for (size_t i = axis + 1; i < shape.size(); i++)
        inner_stride *= shape[i];

    int outer_stride = size() / (axis_dim_size * inner_stride);

    for (int outer_idx = 0; outer_idx < outer_stride; outer_idx++) {
        for (int inner_idx = 0; inner_idx < inner_stride; inner_idx++) {
            const int base = outer_idx * axis_dim_size * inner_stride + inner_idx;

            // max first for numerical stability
            float max_value = data[base];
            for (int d = 1; d < axis_dim_size; d++)
                max_value = std::max(max_value, data[base + d * inner_stride]);

            float exp_sum = 0.f;
            for (int d = 0; d < axis_dim_size; d++) {
                int idx = base + d * inner_stride;
                output_tensor.data[idx] = std::exp(data[idx] - max_value);
                exp_sum += output_tensor.data[idx];
            }

            for (int d = 0; d < axis_dim_size; d++)
                output_tensor.data[base + d * inner_stride] /= exp_sum;
        }
    }

    return output_tensor;
}

Tensor Tensor::matmul(const Tensor& other) const
{
    if (shape.size() != 2 || other.shape.size() != 2)
        throw std::runtime_error("matmul: both operands must be 2D");

    int M = shape[0];
    int K_left = shape[1];
    int K_right = other.shape[0];
    int N = other.shape[1];

    if (K_left != K_right)
        throw std::runtime_error("matmul: shape mismatch " + shape_string() +
                                 " x " + other.shape_string());

    Tensor output_tensor({M, N});

    for (int row = 0; row < M; row++) {
        const float* a_row = data.data() + row * K_left;
        float* out_row = output_tensor.data.data() + row * N;
        for (int k = 0; k < K_left; k++) {
            const float a = a_row[k];
            const float* b_row = other.data.data() + k * N;
            for (int col = 0; col < N; col++)
                out_row[col] += a * b_row[col];
        }
    }

    return output_tensor;
}

bool Tensor::all_finite() const
{
    for (float value : data)
        if (!std::isfinite(value))
            return false;
    return true;
}

std::string Tensor::shape_string() const
{
    std::ostringstream out;
    out << "[";
    for (size_t i = 0; i < shape.size(); i++) {
        out << shape[i];
        if (i + 1 < shape.size())
            out << ", ";
    }
    out << "]";
    return out.str();
}

}
