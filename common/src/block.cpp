#include "t5backbone/block.hpp"
#include <stdexcept>

namespace t5backbone {

T5TransformerLayer::T5TransformerLayer(const BackboneConfig& config, bool is_decoder,
                                       bool use_relative_attention_bias, std::mt19937& rng,
                                       std::string layer_name)
    : is_decoder_(is_decoder),
      name_(std::move(layer_name)),
      self_attention_layer_norm_(config.hidden_dim, config.layer_norm_epsilon),
      self_attention_(config, is_decoder, use_relative_attention_bias, rng, rng()),
      self_attention_dropout_(config.dropout, rng()),
      feedforward_layer_norm_(config.hidden_dim, config.layer_norm_epsilon),
      feedforward_(config, rng, rng()),
      feedforward_dropout_(config.dropout, rng())
{
    if (is_decoder_) {
        cross_attention_layer_norm_ =
            std::make_unique<T5LayerNorm>(config.hidden_dim, config.layer_norm_epsilon);
        cross_attention_ = std::make_unique<MultiHeadAttention>(config, false, false, rng, rng());
        cross_attention_dropout_ = std::make_unique<Dropout>(config.dropout, rng());
    }
}

std::pair<Tensor, PositionBias> T5TransformerLayer::forward(
    const Tensor& hidden_states,
    const Tensor& attention_mask,
    PositionBias position_bias,
    const Tensor* encoder_hidden_states,
    const Tensor* encoder_attention_mask,
    bool training)
{
    Tensor x_norm = self_attention_layer_norm_.forward(hidden_states);

    auto [self_attention_output, new_position_bias] =
        self_attention_.forward(x_norm, &attention_mask, std::move(position_bias), nullptr, training);

    Tensor x = hidden_states + self_attention_dropout_.forward(self_attention_output, training);

    if (is_decoder_) {
        if (!encoder_hidden_states)
            throw std::runtime_error(name_ + ": decoder layer needs encoder hidden states");

        x_norm = cross_attention_layer_norm_->forward(x);

        auto [cross_attention_output, unused_bias] =
            cross_attention_->forward(x_norm, encoder_attention_mask, nullptr,
                                      encoder_hidden_states, training);
        (void)unused_bias;

        x = x + cross_attention_dropout_->forward(cross_attention_output, training);
    }

    x_norm = feedforward_layer_norm_.forward(x);
    x = x + feedforward_dropout_.forward(feedforward_.forward(x_norm, training), training);

    return {x, new_position_bias};
}

int T5TransformerLayer::num_params() const
{
    int total = self_attention_layer_norm_.num_params() + self_attention_.num_params() +
                feedforward_layer_norm_.num_params() + feedforward_.num_params();
    if (is_decoder_)
        total += cross_attention_layer_norm_->num_params() + cross_attention_->num_params();
    return total;
}

}
