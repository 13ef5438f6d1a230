#ifndef T5BACKBONE_BACKBONE_HPP
#define T5BACKBONE_BACKBONE_HPP

#include "t5backbone/config.hpp"
#include "t5backbone/embedding.hpp"
#include "t5backbone/presets.hpp"
#include "t5backbone/stack.hpp"
#include "t5backbone/tensor.hpp"
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace t5backbone {

using TensorMap = std::map<std::string, Tensor>;

struct BackboneTrace {
    StackTrace encoder;
    StackTrace decoder;
};

// T5 encoder-decoder trunk.
//
// Inputs (all [batch, length]):
//   encoder_token_ids, encoder_padding_mask, decoder_token_ids, decoder_padding_mask
// Outputs:
//   encoder_sequence_output [batch, encoder_length, hidden_dim]
//   decoder_sequence_output [batch, decoder_length, hidden_dim]
//
// One token embedding table feeds both stacks. The topology is fixed at
// construction; only the weights are mutable.
class T5Backbone {
public:
    // Throws ConfigError if the configuration is invalid. The seed fixes all
    // initial weights and dropout streams.
    explicit T5Backbone(const BackboneConfig& config, std::uint32_t seed = 0);

    T5Backbone(const T5Backbone&) = delete;
    T5Backbone& operator=(const T5Backbone&) = delete;
    T5Backbone(T5Backbone&&) = default;
    T5Backbone& operator=(T5Backbone&&) = default;

    static T5Backbone from_preset(const std::string& name, std::uint32_t seed = 0);

    TensorMap forward(const TensorMap& inputs, bool training = false, BackboneTrace* trace = nullptr);

    const BackboneConfig& get_config() const { return config_; }

    Embedding& token_embedding() { return *token_embedding_; }
    const Embedding& token_embedding() const { return *token_embedding_; }

    const T5Stack& encoder() const { return *encoder_; }
    const T5Stack& decoder() const { return *decoder_; }

    std::size_t count_params() const;

    static const std::vector<std::string>& input_names();
    static const std::vector<std::string>& output_names();

    // Deep copy of the preset registry.
    static PresetMap presets();

private:
    BackboneConfig config_;
    std::unique_ptr<Embedding> token_embedding_;
    std::unique_ptr<T5Stack> encoder_;
    std::unique_ptr<T5Stack> decoder_;
};

}

#endif
