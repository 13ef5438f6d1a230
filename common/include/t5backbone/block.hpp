#ifndef T5BACKBONE_BLOCK_HPP
#define T5BACKBONE_BLOCK_HPP

#include "t5backbone/attention.hpp"
#include "t5backbone/config.hpp"
#include "t5backbone/dropout.hpp"
#include "t5backbone/feedforward.hpp"
#include "t5backbone/layer_norm.hpp"
#include "t5backbone/tensor.hpp"
#include <memory>
#include <random>
#include <string>
#include <utility>

namespace t5backbone {

// One encoder or decoder layer: pre-norm self-attention, cross-attention
// (decoder only) and feed-forward, each followed by dropout and a residual add.
class T5TransformerLayer {
public:
    T5TransformerLayer(const BackboneConfig& config, bool is_decoder,
                       bool use_relative_attention_bias, std::mt19937& rng,
                       std::string layer_name);

    // Returns the new hidden states and the position bias to hand to the
    // next layer of the stack (the one passed in, or the one computed here).
    std::pair<Tensor, PositionBias> forward(
        const Tensor& hidden_states,
        const Tensor& attention_mask,
        PositionBias position_bias,
        const Tensor* encoder_hidden_states,
        const Tensor* encoder_attention_mask,
        bool training);

    bool is_decoder() const { return is_decoder_; }
    bool use_relative_attention_bias() const { return self_attention_.has_relative_bias; }
    const std::string& name() const { return name_; }
    const MultiHeadAttention& self_attention() const { return self_attention_; }

    int num_params() const;

private:
    bool is_decoder_;
    std::string name_;

    T5LayerNorm self_attention_layer_norm_;
    MultiHeadAttention self_attention_;
    Dropout self_attention_dropout_;

    std::unique_ptr<T5LayerNorm> cross_attention_layer_norm_;
    std::unique_ptr<MultiHeadAttention> cross_attention_;
    std::unique_ptr<Dropout> cross_attention_dropout_;

    T5LayerNorm feedforward_layer_norm_;
    FeedForward feedforward_;
    Dropout feedforward_dropout_;
};

}

#endif
