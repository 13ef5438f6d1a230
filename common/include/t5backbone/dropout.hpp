#ifndef T5BACKBONE_DROPOUT_HPP
#define T5BACKBONE_DROPOUT_HPP

#include "t5backbone/tensor.hpp"
#include <cstdint>
#include <random>

namespace t5backbone {

// Inverted dropout. Identity unless training is requested.
class Dropout {
public:
    explicit Dropout(float rate, std::uint32_t seed = 0);

    Tensor forward(const Tensor& x, bool training);

    float rate() const { return rate_; }

private:
    float rate_;
    std::mt19937 rng_;
};

}

#endif
