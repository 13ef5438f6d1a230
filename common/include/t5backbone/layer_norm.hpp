#ifndef T5BACKBONE_LAYER_NORM_HPP
#define T5BACKBONE_LAYER_NORM_HPP

#include "t5backbone/tensor.hpp"

namespace t5backbone {

// T5 flavour of layer normalization: scales by the root mean square of the
// last axis, no mean subtraction and no bias.
class T5LayerNorm {
public:
    Tensor weight;
    float eps;

    T5LayerNorm(int hidden_size, float epsilon = 1e-6f);

    Tensor forward(const Tensor& x) const;

    int num_params() const { return weight.size(); }
};

}

#endif
