#include "t5backbone/linear.hpp"
#include <stdexcept>

namespace t5backbone {

Linear::Linear(int in_feat, int out_feat, float init_stddev, std::mt19937& rng)
    : in_features(in_feat), out_features(out_feat)
{
    weight = Tensor::randn({in_features, out_features}, 0.0f, init_stddev, rng);
}

Tensor Linear::forward(const Tensor& x) const
{
    if (x.shape.empty() || x.shape.back() != in_features)
        throw std::runtime_error("Linear: input " + x.shape_string() +
                                 " does not end in " + std::to_string(in_features));

    std::vector<int> batch_shape = x.shape;
    batch_shape.pop_back();

    int batch_size = 1;
    for (int dim : batch_shape)
        batch_size *= dim;

    Tensor x_2d = x.reshape({batch_size, in_features});
    Tensor result_2d = x_2d.matmul(weight);

    std::vector<int> output_shape = batch_shape;
    output_shape.push_back(out_features);

    return result_2d.reshape(output_shape);
}

}
