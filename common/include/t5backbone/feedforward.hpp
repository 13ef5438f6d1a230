#ifndef T5BACKBONE_FEEDFORWARD_HPP
#define T5BACKBONE_FEEDFORWARD_HPP

#include "t5backbone/activation.hpp"
#include "t5backbone/config.hpp"
#include "t5backbone/dropout.hpp"
#include "t5backbone/linear.hpp"
#include "t5backbone/tensor.hpp"
#include <cstdint>
#include <memory>
#include <random>

namespace t5backbone {

// wo(dropout(act(wi x) [* wi_gate x]))
class FeedForward {
public:
    Linear wi;
    std::unique_ptr<Linear> wi_gate;  // only with gated activation
    Linear wo;

    FeedForward(const BackboneConfig& config, std::mt19937& rng, std::uint32_t dropout_seed);

    Tensor forward(const Tensor& x, bool training);

    int num_params() const;

private:
    activation::Function activation_;
    Dropout dropout_;
};

}

#endif
