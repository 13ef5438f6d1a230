#include "t5backbone/feedforward.hpp"
#include <cmath>

namespace t5backbone {

FeedForward::FeedForward(const BackboneConfig& config, std::mt19937& rng, std::uint32_t dropout_seed)
    : wi(config.hidden_dim, config.intermediate_dim,
         std::pow(static_cast<float>(config.hidden_dim), -0.5f), rng),
      wo(config.intermediate_dim, config.hidden_dim,
         std::pow(static_cast<float>(config.intermediate_dim), -0.5f), rng),
      activation_(activation::get(config.activation)),
      dropout_(config.dropout, dropout_seed)
{
    if (config.use_gated_activation)
        wi_gate = std::make_unique<Linear>(config.hidden_dim, config.intermediate_dim,
                                           std::pow(static_cast<float>(config.hidden_dim), -0.5f), rng);
}

Tensor FeedForward::forward(const Tensor& x, bool training)
{
    Tensor hidden = activation_(wi.forward(x));
    if (wi_gate)
        hidden = hidden * wi_gate->forward(x);
    hidden = dropout_.forward(hidden, training);
    return wo.forward(hidden);
}

int FeedForward::num_params() const
{
    return wi.num_params() + wo.num_params() + (wi_gate ? wi_gate->num_params() : 0);
}

}
