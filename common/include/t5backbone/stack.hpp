#ifndef T5BACKBONE_STACK_HPP
#define T5BACKBONE_STACK_HPP

#include "t5backbone/block.hpp"
#include "t5backbone/config.hpp"
#include "t5backbone/dropout.hpp"
#include "t5backbone/embedding.hpp"
#include "t5backbone/layer_norm.hpp"
#include "t5backbone/tensor.hpp"
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace t5backbone {

// What one stack did during a forward call.
struct StackTrace {
    std::vector<PositionBias> consumed_position_bias;  // per layer, as passed in
    std::vector<PositionBias> produced_position_bias;  // per layer, as returned
    Tensor attention_mask;
};

// Embedding lookup, a run of transformer layers sharing one position bias,
// closing norm and dropout. The embedding is borrowed from the owning backbone.
class T5Stack {
public:
    T5Stack(const BackboneConfig& config, bool is_decoder, const Embedding* shared_embedding,
            std::mt19937& rng);

    Tensor forward(
        const Tensor& token_ids,
        const Tensor& attention_mask,
        const Tensor* encoder_hidden_states,
        const Tensor* encoder_attention_mask,
        bool training,
        StackTrace* trace = nullptr);

    bool is_decoder() const { return is_decoder_; }
    const Embedding& embedding() const { return *embedding_; }
    size_t num_layers() const { return layers_.size(); }
    const T5TransformerLayer& layer(size_t index) const { return *layers_.at(index); }

    // Excludes the borrowed embedding.
    int num_params() const;

private:
    bool is_decoder_;
    const Embedding* embedding_;
    Dropout embedding_dropout_;
    std::vector<std::unique_ptr<T5TransformerLayer>> layers_;
    T5LayerNorm output_layer_norm_;
    Dropout output_dropout_;
};

}

#endif
