#ifndef T5BACKBONE_LINEAR_HPP
#define T5BACKBONE_LINEAR_HPP

#include "t5backbone/tensor.hpp"
#include <random>

namespace t5backbone {

// Dense projection without bias; kernel laid out [in, out].
class Linear {
public:
    Tensor weight;
    int in_features;
    int out_features;

    Linear(int in_feat, int out_feat, float init_stddev, std::mt19937& rng);

    Tensor forward(const Tensor& x) const;

    int num_params() const { return weight.size(); }
};

}

#endif
