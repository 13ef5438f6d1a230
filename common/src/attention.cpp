#include "t5backbone/attention.hpp"
#include <algorithm>
#include <cmath>
#include <cstring>
#include <stdexcept>

namespace t5backbone {

namespace {
constexpr float kMaskedScore = -1e9f;
}

MultiHeadAttention::MultiHeadAttention(const BackboneConfig& config, bool is_decoder,
                                       bool has_relative_bias, std::mt19937& rng,
                                       std::uint32_t dropout_seed)
    : q_proj(config.hidden_dim, config.inner_dim(),
             std::pow(static_cast<float>(config.inner_dim() * config.key_value_dim()), -0.5f), rng),
      k_proj(config.hidden_dim, config.inner_dim(),
             std::pow(static_cast<float>(config.inner_dim()), -0.5f), rng),
      v_proj(config.hidden_dim, config.inner_dim(),
             std::pow(static_cast<float>(config.inner_dim()), -0.5f), rng),
      o_proj(config.inner_dim(), config.hidden_dim,
             std::pow(static_cast<float>(config.inner_dim()), -0.5f), rng),
      hidden_dim(config.hidden_dim),
      n_heads(config.num_heads),
      d_kv(config.key_value_dim()),
      inner_dim(config.inner_dim()),
      has_relative_bias(has_relative_bias),
      is_decoder(is_decoder),
      num_buckets(BackboneConfig::relative_attention_buckets),
      max_distance(BackboneConfig::relative_attention_max_distance),
      attention_dropout_(config.dropout, dropout_seed)
{
    if (has_relative_bias)
        relative_attention_bias = Tensor::randn({num_buckets, n_heads}, 0.0f,
                                                std::pow(static_cast<float>(inner_dim), -0.5f), rng);
}

// Reference: "Exploring the Limits of Transfer Learning with a Unified Text-to-Text Transformer"
// https://arxiv.org/abs/1910.10683

int MultiHeadAttention::relative_position_to_bucket(int relative_position, bool bidirectional,
                                                    int num_buckets, int max_distance)
{
    int number_buckets = num_buckets;
    int bucket = 0;

    // The encoder sees both directions, so the buckets are split between
    // previous and next positions.
    if (bidirectional) {
        number_buckets = number_buckets / 2;

        // key after query: forward direction
        if (relative_position > 0)
            bucket += number_buckets;

        relative_position = std::abs(relative_position);
    } else {
        // The decoder only looks back, so (key - query) <= 0 matters.
        relative_position = -std::min(relative_position, 0);
    }

    int max_exact = number_buckets / 2;

    // small distances get one bucket each
    if (relative_position < max_exact)
        return bucket + relative_position;

    // larger distances share logarithmically sized buckets up to max_distance
    float log_ratio = std::log(static_cast<float>(relative_position) / max_exact);
    float log_max = std::log(static_cast<float>(max_distance) / max_exact);

    int pos = max_exact + static_cast<int>(log_ratio / log_max * (number_buckets - max_exact));
    bucket += std::min(pos, number_buckets - 1);

    return bucket;
}

PositionBias MultiHeadAttention::compute_bias(int query_len, int key_len) const
{
    if (!has_relative_bias)
        throw std::runtime_error("compute_bias: layer has no relative attention bias table");

    auto bias = std::make_shared<Tensor>(std::vector<int>{n_heads, query_len, key_len});
    const bool bidirectional = !is_decoder;

    for (int query = 0; query < query_len; ++query) {
        for (int key = 0; key < key_len; ++key) {
            int bucket_idx = relative_position_to_bucket(key - query, bidirectional,
                                                         num_buckets, max_distance);
            for (int head = 0; head < n_heads; ++head) {
                int index = head * (query_len * key_len) + query * key_len + key;
                bias->data[index] = relative_attention_bias.data[bucket_idx * n_heads + head];
            }
        }
    }

    return bias;
}

std::pair<Tensor, PositionBias> MultiHeadAttention::forward(
    const Tensor& hidden_states,
    const Tensor* mask,
    PositionBias position_bias,
    const Tensor* key_value_states,
    bool training)
{
    if (hidden_states.rank() != 3 || hidden_states.shape[2] != hidden_dim)
        throw std::runtime_error("MultiHeadAttention: expected [batch, seq, " +
                                 std::to_string(hidden_dim) + "], got " +
                                 hidden_states.shape_string());

    // key_value_states are used for cross-attention (decoder),
    // hidden_states for self-attention
    const Tensor& kv_in = key_value_states ? *key_value_states : hidden_states;
    if (kv_in.rank() != 3 || kv_in.shape[0] != hidden_states.shape[0] || kv_in.shape[2] != hidden_dim)
        throw std::runtime_error("MultiHeadAttention: key/value states " + kv_in.shape_string() +
                                 " incompatible with " + hidden_states.shape_string());

    const int batch = hidden_states.shape[0];
    const int seq_len = hidden_states.shape[1];
    const int k_len = kv_in.shape[1];

    if (mask) {
        if (mask->rank() != 3 || mask->shape[0] != batch || mask->shape[2] != k_len ||
            (mask->shape[1] != 1 && mask->shape[1] != seq_len))
            throw std::runtime_error("MultiHeadAttention: mask " + mask->shape_string() +
                                     " incompatible with query " + std::to_string(seq_len) +
                                     " and key " + std::to_string(k_len));
    }

    if (!position_bias) {
        if (has_relative_bias)
            position_bias = compute_bias(seq_len, k_len);
        else
            position_bias = std::make_shared<const Tensor>(std::vector<int>{n_heads, seq_len, k_len});
    } else if (position_bias->shape != std::vector<int>{n_heads, seq_len, k_len}) {
        throw std::runtime_error("MultiHeadAttention: position bias " + position_bias->shape_string() +
                                 " does not match attention scores");
    }
    const Tensor& bias = *position_bias;

    // [B, S, H*D] -> [B, H, S, D]
    Tensor q = q_proj.forward(hidden_states).reshape({batch, seq_len, n_heads, d_kv}).permute({0, 2, 1, 3});
    Tensor k = k_proj.forward(kv_in).reshape({batch, k_len, n_heads, d_kv}).permute({0, 2, 1, 3});
    Tensor v = v_proj.forward(kv_in).reshape({batch, k_len, n_heads, d_kv}).permute({0, 2, 1, 3});

    Tensor context_layer({batch, n_heads, seq_len, d_kv});

    const int q_head_size = seq_len * d_kv;
    const int k_head_size = k_len * d_kv;
    const int bias_head_size = seq_len * k_len;

    // empty query or key side leaves the context at zero
    const int head_batches = (seq_len == 0 || k_len == 0) ? 0 : batch;

    for (int b = 0; b < head_batches; ++b) {
        for (int h = 0; h < n_heads; ++h) {
            const int head_slot = b * n_heads + h;

            Tensor q_h({seq_len, d_kv});
            std::memcpy(q_h.data.data(), q.data.data() + head_slot * q_head_size,
                        q_head_size * sizeof(float));

            Tensor k_h({k_len, d_kv});
            std::memcpy(k_h.data.data(), k.data.data() + head_slot * k_head_size,
                        k_head_size * sizeof(float));

            Tensor v_h({k_len, d_kv});
            std::memcpy(v_h.data.data(), v.data.data() + head_slot * k_head_size,
                        k_head_size * sizeof(float));

            // Attention(Q,K,V) = Softmax(Q * K^T + B + M) * V
            // T5 folds the 1/sqrt(d) scaling into the query initializer.
            Tensor scores = q_h.matmul(k_h.transpose());

            const float* bias_h = bias.data.data() + h * bias_head_size;
            for (int i = 0; i < bias_head_size; ++i)
                scores.data[i] += bias_h[i];

            if (mask) {
                const int mask_rows = mask->shape[1];
                const float* mask_b = mask->data.data() + b * mask_rows * k_len;
                for (int i = 0; i < seq_len; ++i) {
                    const float* mask_row = mask_b + (mask_rows == 1 ? 0 : i) * k_len;
                    for (int j = 0; j < k_len; ++j)
                        if (mask_row[j] == 0.0f)
                            scores.data[i * k_len + j] += kMaskedScore;
                }
            }

            scores = attention_dropout_.forward(scores.softmax(), training);

            Tensor head_out = scores.matmul(v_h);

            std::memcpy(context_layer.data.data() + head_slot * q_head_size,
                        head_out.data.data(), q_head_size * sizeof(float));
        }
    }

    // [B, H, S, D] -> [B, S, H, D] -> [B, S, inner_dim]
    context_layer = context_layer.permute({0, 2, 1, 3}).reshape({batch, seq_len, inner_dim});

    Tensor output = o_proj.forward(context_layer);

    return {output, position_bias};
}

int MultiHeadAttention::num_params() const
{
    return q_proj.num_params() + k_proj.num_params() + v_proj.num_params() +
           o_proj.num_params() + relative_attention_bias.size();
}

}
