#ifndef T5BACKBONE_ATTENTION_HPP
#define T5BACKBONE_ATTENTION_HPP

#include "t5backbone/config.hpp"
#include "t5backbone/dropout.hpp"
#include "t5backbone/linear.hpp"
#include "t5backbone/tensor.hpp"
#include <cstdint>
#include <memory>
#include <random>
#include <utility>

namespace t5backbone {

using PositionBias = std::shared_ptr<const Tensor>;

class MultiHeadAttention {
public:
    Linear q_proj;
    Linear k_proj;
    Linear v_proj;
    Linear o_proj;

    // [num_buckets, n_heads]; empty unless has_relative_bias.
    Tensor relative_attention_bias;

    int hidden_dim;
    int n_heads;
    int d_kv;
    int inner_dim;
    bool has_relative_bias;
    bool is_decoder;
    int num_buckets;
    int max_distance;

    MultiHeadAttention(const BackboneConfig& config, bool is_decoder, bool has_relative_bias,
                       std::mt19937& rng, std::uint32_t dropout_seed);

    static int relative_position_to_bucket(int relative_position, bool bidirectional,
                                           int num_buckets, int max_distance);

    // [n_heads, query_len, key_len] bias looked up from the bucket table.
    PositionBias compute_bias(int query_len, int key_len) const;

    // hidden_states: [batch, q_len, hidden_dim]
    // mask: [batch, 1 or q_len, k_len], non-zero = may attend; nullptr = no mask
    // position_bias: reused as-is when given, otherwise computed (or zeros
    //   for a layer without its own bias table)
    // key_value_states: encoder output for cross-attention, nullptr for self
    // Returns the projected output and the position bias that was applied.
    std::pair<Tensor, PositionBias> forward(
        const Tensor& hidden_states,
        const Tensor* mask,
        PositionBias position_bias,
        const Tensor* key_value_states,
        bool training);

    int num_params() const;

private:
    Dropout attention_dropout_;
};

}

#endif
