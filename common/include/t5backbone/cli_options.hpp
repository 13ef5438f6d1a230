#ifndef T5BACKBONE_CLI_OPTIONS_HPP
#define T5BACKBONE_CLI_OPTIONS_HPP

#include "t5backbone/backbone.hpp"
#include "t5backbone/config.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace t5backbone {

// Hyperparameters given on the command line; unset fields leave the
// preset or file value alone.
struct ConfigOverrides {
    std::optional<int> num_layers;
    std::optional<int> num_heads;
    std::optional<int> vocabulary_size;
    std::optional<int> hidden_dim;
    std::optional<int> intermediate_dim;
    std::optional<float> dropout;
    std::optional<std::string> activation;
    std::optional<bool> use_gated_activation;
    std::optional<float> layer_norm_epsilon;
};

// Options shared by the t5backbone_run and t5backbone_mpi drivers.
struct RunOptions {
    std::string preset;
    std::string config_file;
    ConfigOverrides overrides;

    bool list_presets = false;
    bool dump_config = false;
    bool verbose = false;
    bool help = false;

    std::uint32_t seed = 0;
    int batch = 2;
    int encoder_length = 8;
    int decoder_length = 8;

    std::string vocab_file;
    std::string text;
    std::string target;
};

// Throws ConfigError for an unknown flag, a missing value or a bad number.
RunOptions parse_run_options(int argc, char** argv);

void print_usage(const char* program);

// Preset, then config file, then every given flag on top, then validate().
// Flag values are applied as given, so a bad one raises ConfigError.
BackboneConfig resolve_config(const RunOptions& options);

// Uniform random ids in [0, vocabulary_size), all positions real.
TensorMap make_random_inputs(int batch, int encoder_length, int decoder_length, int vocabulary_size,
                             std::uint32_t seed);

// Shape, mean, stddev, min and max of every output.
void print_output_summary(const TensorMap& outputs);

}

#endif
