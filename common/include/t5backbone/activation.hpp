#ifndef T5BACKBONE_ACTIVATION_HPP
#define T5BACKBONE_ACTIVATION_HPP

#include "t5backbone/tensor.hpp"
#include <functional>
#include <string>

namespace t5backbone {
namespace activation {

using Function = std::function<Tensor(const Tensor&)>;

Tensor relu(const Tensor& input_tensor);
Tensor gelu(const Tensor& input_tensor);
Tensor gelu_approximate(const Tensor& input_tensor);
Tensor silu(const Tensor& input_tensor);
Tensor linear(const Tensor& input_tensor);

bool is_known(const std::string& name);

// Throws ConfigError for an unknown name.
Function get(const std::string& name);

}
}

#endif
