#include "t5backbone/dropout.hpp"
#include <stdexcept>

namespace t5backbone {

Dropout::Dropout(float rate, std::uint32_t seed)
    : rate_(rate), rng_(seed)
{
    if (!(rate >= 0.0f && rate < 1.0f))
        throw std::runtime_error("Dropout: rate must be in [0, 1)");
}

Tensor Dropout::forward(const Tensor& x, bool training)
{
    if (!training || rate_ == 0.0f)
        return x;

    Tensor output_tensor = x;
    std::bernoulli_distribution keep(1.0 - rate_);
    const float scale = 1.0f / (1.0f - rate_);

    for (float& value : output_tensor.data)
        value = keep(rng_) ? value * scale : 0.0f;

    return output_tensor;
}

}
