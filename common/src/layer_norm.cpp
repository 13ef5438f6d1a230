#include "t5backbone/layer_norm.hpp"
#include <cmath>
#include <stdexcept>

namespace t5backbone {

T5LayerNorm::T5LayerNorm(int hidden_size, float epsilon)
    : weight({hidden_size}, 1.0f), eps(epsilon)
{
}

Tensor T5LayerNorm::forward(const Tensor& x) const
{
    if (x.shape.empty())
        throw std::runtime_error("T5LayerNorm: scalar input");

    int hidden_size = x.shape.back();
    if (hidden_size != weight.size())
        throw std::runtime_error("T5LayerNorm: input hidden_size mismatch");

    int rows = hidden_size == 0 ? 0 : x.size() / hidden_size;
    Tensor result(x.shape);

    for (int s = 0; s < rows; s++) {
        const float* in_row = x.data.data() + s * hidden_size;
        float* out_row = result.data.data() + s * hidden_size;

        float variance = 0.0f;
        for (int h = 0; h < hidden_size; h++)
            variance += in_row[h] * in_row[h];
        variance /= hidden_size;

        float inv_std = 1.0f / std::sqrt(variance + eps);

        for (int h = 0; h < hidden_size; h++)
            out_row[h] = in_row[h] * inv_std * weight.data[h];
    }

    return result;
}

}
