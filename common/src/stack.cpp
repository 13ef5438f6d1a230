#include "t5backbone/stack.hpp"
#include "t5backbone/logging.hpp"
#include <stdexcept>

namespace t5backbone {

T5Stack::T5Stack(const BackboneConfig& config, bool is_decoder, const Embedding* shared_embedding,
                 std::mt19937& rng)
    : is_decoder_(is_decoder),
      embedding_(shared_embedding),
      embedding_dropout_(config.dropout, rng()),
      output_layer_norm_(config.hidden_dim, config.layer_norm_epsilon),
      output_dropout_(config.dropout, rng())
{
    if (!embedding_)
        throw std::runtime_error("T5Stack: shared embedding is null");

    const std::string prefix = is_decoder ? "transformer_decoder_layer_" : "transformer_encoder_layer_";
    for (int i = 0; i < config.num_layers; i++) {
        // only the first layer owns a relative position bias table
        layers_.push_back(std::make_unique<T5TransformerLayer>(
            config, is_decoder, i == 0, rng, prefix + std::to_string(i)));
    }
}

Tensor T5Stack::forward(
    const Tensor& token_ids,
    const Tensor& attention_mask,
    const Tensor* encoder_hidden_states,
    const Tensor* encoder_attention_mask,
    bool training,
    StackTrace* trace)
{
    Tensor hidden = embedding_dropout_.forward(embedding_->forward(token_ids), training);

    if (trace) {
        trace->consumed_position_bias.clear();
        trace->produced_position_bias.clear();
        trace->attention_mask = attention_mask;
    }

    PositionBias position_bias;

    for (auto& layer : layers_) {
        if (trace)
            trace->consumed_position_bias.push_back(position_bias);

        auto [new_hidden, new_bias] = layer->forward(hidden, attention_mask, position_bias,
                                                     encoder_hidden_states,
                                                     encoder_attention_mask, training);
        hidden = std::move(new_hidden);
        position_bias = std::move(new_bias);

        if (trace)
            trace->produced_position_bias.push_back(position_bias);
    }

    T5BACKBONE_LOG_DEBUG("%s stack: %zu layers, output %s", is_decoder_ ? "decoder" : "encoder",
                         layers_.size(), hidden.shape_string().c_str());

    hidden = output_layer_norm_.forward(hidden);
    return output_dropout_.forward(hidden, training);
}

int T5Stack::num_params() const
{
    int total = output_layer_norm_.num_params();
    for (const auto& layer : layers_)
        total += layer->num_params();
    return total;
}

}
