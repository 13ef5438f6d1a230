#ifndef T5BACKBONE_CONFIG_HPP
#define T5BACKBONE_CONFIG_HPP

#include <string>

namespace t5backbone {

// Architecture hyperparameters of a T5 backbone.
struct BackboneConfig {
    int num_layers = 0;
    int num_heads = 0;
    int vocabulary_size = 0;
    int hidden_dim = 0;
    int intermediate_dim = 0;
    float dropout = 0.1f;
    std::string activation = "relu";
    bool use_gated_activation = false;
    float layer_norm_epsilon = 1e-6f;

    // Relative position bucketing, fixed for the T5 family.
    static constexpr int relative_attention_buckets = 32;
    static constexpr int relative_attention_max_distance = 128;

    int key_value_dim() const { return hidden_dim / num_heads; }
    int inner_dim() const { return num_heads * key_value_dim(); }

    // Throws ConfigError describing the first invalid field.
    void validate() const;

    std::string to_json() const;

    // Accepts the output of to_json() and similar flat JSON objects; one or
    // many keys per line. Unknown keys are ignored.
    static BackboneConfig from_json(const std::string& text);

    static BackboneConfig load(const std::string& filepath);
    void save(const std::string& filepath) const;

    void print() const;
};

bool operator==(const BackboneConfig& lhs, const BackboneConfig& rhs);
bool operator!=(const BackboneConfig& lhs, const BackboneConfig& rhs);

}

#endif
