#include "t5backbone/activation.hpp"
#include "t5backbone/errors.hpp"
#include <cmath>

namespace t5backbone {
namespace activation {

Tensor relu(const Tensor& input_tensor)
{
    Tensor output_tensor = input_tensor;

    for (float& value : output_tensor.data)
        value = value > 0 ? value : 0.0f;

    return output_tensor;
}

Tensor gelu(const Tensor& input_tensor)
{
    Tensor output_tensor = input_tensor;
    const float inv_sqrt2 = 0.70710678118654752f;

    for (float& value : output_tensor.data)
        value = 0.5f * value * (1.0f + std::erf(value * inv_sqrt2));

    return output_tensor;
}

Tensor gelu_approximate(const Tensor& input_tensor)
{
    Tensor output_tensor = input_tensor;
    const float sqrt_2_over_pi = 0.79788456080286536f;

    for (float& value : output_tensor.data) {
        float inner = sqrt_2_over_pi * (value + 0.044715f * value * value * value);
        value = 0.5f * value * (1.0f + std::tanh(inner));
    }

    return output_tensor;
}

Tensor silu(const Tensor& input_tensor)
{
    Tensor output_tensor = input_tensor;

    for (float& value : output_tensor.data)
        value = value / (1.0f + std::exp(-value));

    return output_tensor;
}

Tensor linear(const Tensor& input_tensor)
{
    return input_tensor;
}

namespace {
const Function* lookup(const std::string& name)
{
    static const Function relu_fn = relu;
    static const Function gelu_fn = gelu;
    static const Function gelu_approximate_fn = gelu_approximate;
    static const Function silu_fn = silu;
    static const Function linear_fn = linear;

    if (name == "relu")
        return &relu_fn;
    if (name == "gelu")
        return &gelu_fn;
    // presets exported from keras_nlp spell it with the package prefix
    if (name == "gelu_approximate" || name == "keras_nlp>gelu_approximate")
        return &gelu_approximate_fn;
    if (name == "silu" || name == "swish")
        return &silu_fn;
    if (name == "linear")
        return &linear_fn;
    return nullptr;
}
}

bool is_known(const std::string& name)
{
    return lookup(name) != nullptr;
}

Function get(const std::string& name)
{
    const Function* fn = lookup(name);
    if (!fn)
        throw ConfigError("unknown activation '" + name +
                          "' (expected relu, gelu, gelu_approximate, silu or linear)");
    return *fn;
}

}
}
