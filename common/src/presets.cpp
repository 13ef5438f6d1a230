#include "t5backbone/presets.hpp"
#include "t5backbone/errors.hpp"
#include <utility>

namespace t5backbone {

namespace {

const char* const kModelCard =
    "https://github.com/google-research/text-to-text-transfer-transformer/blob/main/README.md";

BackboneConfig make_config(int num_layers, int num_heads, int hidden_dim, int intermediate_dim,
                           const std::string& activation, bool gated)
{
    BackboneConfig config;
    config.num_layers = num_layers;
    config.num_heads = num_heads;
    config.vocabulary_size = 32128;
    config.hidden_dim = hidden_dim;
    config.intermediate_dim = intermediate_dim;
    config.dropout = 0.1f;
    config.activation = activation;
    config.use_gated_activation = gated;
    config.layer_norm_epsilon = 1e-6f;
    return config;
}

Preset make_preset(const std::string& name, const std::string& description, BackboneConfig config)
{
    Preset preset;
    preset.config = std::move(config);
    preset.metadata.description = description;
    preset.metadata.official_name = "T5";
    preset.metadata.path = "t5";
    preset.metadata.model_card = kModelCard;
    preset.weights_file = name + "/model.weights.bin";
    preset.vocabulary_file = name + "/vocabulary.spm";
    return preset;
}

// Canonical registry; only ever handed out by copy.
const PresetMap& canonical_presets()
{
    static const PresetMap presets = {
        {"t5_small_multi",
         make_preset("t5_small_multi",
                     "6-layer T5 model. Trained on the Colossal Clean Crawled Corpus (C4).",
                     make_config(6, 8, 512, 2048, "relu", false))},
        {"t5_base_multi",
         make_preset("t5_base_multi",
                     "12-layer T5 model. Trained on the Colossal Clean Crawled Corpus (C4).",
                     make_config(12, 12, 768, 3072, "relu", false))},
        {"t5_large_multi",
         make_preset("t5_large_multi",
                     "24-layer T5 model. Trained on the Colossal Clean Crawled Corpus (C4).",
                     make_config(24, 16, 1024, 4096, "relu", false))},
        {"flan_small_multi",
         make_preset("flan_small_multi",
                     "8-layer T5 model. Trained on C4, then instruction-tuned on the FLAN collection.",
                     make_config(8, 6, 512, 1024, "gelu_approximate", true))},
        {"flan_base_multi",
         make_preset("flan_base_multi",
                     "12-layer T5 model. Trained on C4, then instruction-tuned on the FLAN collection.",
                     make_config(12, 12, 768, 2048, "gelu_approximate", true))},
        {"flan_large_multi",
         make_preset("flan_large_multi",
                     "24-layer T5 model. Trained on C4, then instruction-tuned on the FLAN collection.",
                     make_config(24, 16, 1024, 2816, "gelu_approximate", true))},
    };
    return presets;
}

}

PresetMap backbone_presets()
{
    return canonical_presets();
}

Preset get_preset(const std::string& name)
{
    const PresetMap& presets = canonical_presets();
    auto it = presets.find(name);
    if (it == presets.end()) {
        std::string known;
        for (const auto& entry : presets)
            known += (known.empty() ? "" : ", ") + entry.first;
        throw PresetNotFoundError("unknown preset '" + name + "'; available: " + known);
    }
    return it->second;
}

std::vector<std::string> preset_names()
{
    std::vector<std::string> names;
    for (const auto& entry : canonical_presets())
        names.push_back(entry.first);
    return names;
}

}
