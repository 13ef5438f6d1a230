#ifndef T5BACKBONE_TENSOR_HPP
#define T5BACKBONE_TENSOR_HPP

#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace t5backbone {

// Dense row-major float tensor. Token ids and masks are stored as integral
// float values as well.
class Tensor {
public:
    std::vector<int> shape;
    std::vector<float> data;

    Tensor();
    explicit Tensor(const std::vector<int>& shape_in, float fill_value = 0.0f);
    Tensor(const std::vector<int>& shape_in, std::vector<float> values);

    static int numel(const std::vector<int>& shape_in);

    static Tensor zeros(const std::vector<int>& shape_in);
    static Tensor ones(const std::vector<int>& shape_in);
    static Tensor randn(const std::vector<int>& shape_in, float mean, float stddev, std::mt19937& rng);

    // Values further than two standard deviations from the mean are redrawn.
    static Tensor truncated_normal(const std::vector<int>& shape_in, float mean, float stddev, std::mt19937& rng);

    int size() const;
    int rank() const { return static_cast<int>(shape.size()); }
    int dim(int axis) const;

    Tensor reshape(const std::vector<int>& new_shape) const;

    Tensor permute(const std::vector<int>& new_axis_order) const;

    Tensor transpose() const;

    Tensor softmax(int axis = -1) const;

    Tensor matmul(const Tensor& other) const;

    Tensor operator+(const Tensor& other) const;
    Tensor operator*(const Tensor& other) const;
    Tensor operator*(float scalar) const;

    bool all_finite() const;

    std::string shape_string() const;

private:
    static std::vector<int> compute_strides(const std::vector<int>& shape_in);
};

}

#endif
