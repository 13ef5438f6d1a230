#include "t5backbone/backbone.hpp"
#include "t5backbone/logging.hpp"
#include "t5backbone/masks.hpp"
#include <random>
#include <stdexcept>

namespace t5backbone {

namespace {

const BackboneConfig& validated(const BackboneConfig& config)
{
    config.validate();
    return config;
}

const Tensor& require_input(const TensorMap& inputs, const std::string& name)
{
    auto it = inputs.find(name);
    if (it == inputs.end())
        throw std::runtime_error("T5Backbone: missing input '" + name + "'");
    if (it->second.rank() != 2)
        throw std::runtime_error("T5Backbone: input '" + name + "' must be [batch, length], got " +
                                 it->second.shape_string());
    return it->second;
}

void require_same_shape(const Tensor& ids, const Tensor& mask, const std::string& what)
{
    if (ids.shape != mask.shape)
        throw std::runtime_error("T5Backbone: " + what + " token ids " + ids.shape_string() +
                                 " and padding mask " + mask.shape_string() + " differ");
}

}

T5Backbone::T5Backbone(const BackboneConfig& config, std::uint32_t seed)
    : config_(validated(config))
{
    std::mt19937 rng(seed);

    token_embedding_ = std::make_unique<Embedding>(config_.vocabulary_size, config_.hidden_dim,
                                                   1.0f, rng, "token_embedding");
    encoder_ = std::make_unique<T5Stack>(config_, false, token_embedding_.get(), rng);
    decoder_ = std::make_unique<T5Stack>(config_, true, token_embedding_.get(), rng);

    T5BACKBONE_LOG_DEBUG("T5Backbone: %d layers, %d heads, hidden %d, %zu parameters",
                         config_.num_layers, config_.num_heads, config_.hidden_dim, count_params());
}

T5Backbone T5Backbone::from_preset(const std::string& name, std::uint32_t seed)
{
    return T5Backbone(get_preset(name).config, seed);
}

TensorMap T5Backbone::forward(const TensorMap& inputs, bool training, BackboneTrace* trace)
{
    const Tensor& encoder_token_ids = require_input(inputs, "encoder_token_ids");
    const Tensor& encoder_padding_mask = require_input(inputs, "encoder_padding_mask");
    const Tensor& decoder_token_ids = require_input(inputs, "decoder_token_ids");
    const Tensor& decoder_padding_mask = require_input(inputs, "decoder_padding_mask");

    require_same_shape(encoder_token_ids, encoder_padding_mask, "encoder");
    require_same_shape(decoder_token_ids, decoder_padding_mask, "decoder");
    if (encoder_token_ids.shape[0] != decoder_token_ids.shape[0])
        throw std::runtime_error("T5Backbone: encoder batch " + std::to_string(encoder_token_ids.shape[0]) +
                                 " and decoder batch " + std::to_string(decoder_token_ids.shape[0]) +
                                 " differ");

    // ===== Encoder =====
    // encoder attention mask is just the padding mask
    Tensor encoder_attention_mask = expand_padding_mask(encoder_padding_mask);

    Tensor encoder_output = encoder_->forward(encoder_token_ids, encoder_attention_mask,
                                              nullptr, nullptr, training,
                                              trace ? &trace->encoder : nullptr);

    // ===== Decoder =====
    // decoder attention mask is the padding mask plus a causal mask
    const int batch_size = decoder_token_ids.shape[0];
    const int length = decoder_token_ids.shape[1];
    Tensor causal_mask = compute_causal_mask(batch_size, length, length);
    Tensor decoder_attention_mask = merge_masks(causal_mask, expand_padding_mask(decoder_padding_mask));

    Tensor decoder_output = decoder_->forward(decoder_token_ids, decoder_attention_mask,
                                              &encoder_output, &encoder_attention_mask, training,
                                              trace ? &trace->decoder : nullptr);

    TensorMap outputs;
    outputs.emplace("encoder_sequence_output", std::move(encoder_output));
    outputs.emplace("decoder_sequence_output", std::move(decoder_output));
    return outputs;
}

std::size_t T5Backbone::count_params() const
{
    return static_cast<std::size_t>(token_embedding_->num_params()) +
           static_cast<std::size_t>(encoder_->num_params()) +
           static_cast<std::size_t>(decoder_->num_params());
}

const std::vector<std::string>& T5Backbone::input_names()
{
    static const std::vector<std::string> names = {
        "encoder_token_ids", "encoder_padding_mask", "decoder_token_ids", "decoder_padding_mask"};
    return names;
}

const std::vector<std::string>& T5Backbone::output_names()
{
    static const std::vector<std::string> names = {
        "encoder_sequence_output", "decoder_sequence_output"};
    return names;
}

PresetMap T5Backbone::presets()
{
    return backbone_presets();
}

}
