#include "t5backbone/cli_options.hpp"
#include "t5backbone/errors.hpp"
#include "t5backbone/presets.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <random>

namespace t5backbone {

namespace {

const char* require_value(int& i, int argc, char** argv)
{
    if (i + 1 >= argc)
        throw ConfigError(std::string("missing value for ") + argv[i]);
    return argv[++i];
}

int to_int(const char* flag, const char* value)
{
    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != std::strlen(value))
            throw std::invalid_argument(value);
        return parsed;
    } catch (const std::logic_error&) {
        throw ConfigError(std::string(flag) + " expects an integer, got '" + value + "'");
    }
}

float to_float(const char* flag, const char* value)
{
    try {
        size_t consumed = 0;
        float parsed = std::stof(value, &consumed);
        if (consumed != std::strlen(value))
            throw std::invalid_argument(value);
        return parsed;
    } catch (const std::logic_error&) {
        throw ConfigError(std::string(flag) + " expects a number, got '" + value + "'");
    }
}

}

RunOptions parse_run_options(int argc, char** argv)
{
    RunOptions options;
    ConfigOverrides& o = options.overrides;

    for (int i = 1; i < argc; i++) {
        const char* flag = argv[i];
        if (!std::strcmp(flag, "--preset")) {
            options.preset = require_value(i, argc, argv);
        } else if (!std::strcmp(flag, "--config")) {
            options.config_file = require_value(i, argc, argv);
        } else if (!std::strcmp(flag, "--num-layers")) {
            o.num_layers = to_int(flag, require_value(i, argc, argv));
        } else if (!std::strcmp(flag, "--num-heads")) {
            o.num_heads = to_int(flag, require_value(i, argc, argv));
        } else if (!std::strcmp(flag, "--vocabulary-size")) {
            o.vocabulary_size = to_int(flag, require_value(i, argc, argv));
        } else if (!std::strcmp(flag, "--hidden-dim")) {
            o.hidden_dim = to_int(flag, require_value(i, argc, argv));
        } else if (!std::strcmp(flag, "--intermediate-dim")) {
            o.intermediate_dim = to_int(flag, require_value(i, argc, argv));
        } else if (!std::strcmp(flag, "--dropout")) {
            o.dropout = to_float(flag, require_value(i, argc, argv));
        } else if (!std::strcmp(flag, "--activation")) {
            o.activation = std::string(require_value(i, argc, argv));
        } else if (!std::strcmp(flag, "--gated")) {
            o.use_gated_activation = true;
        } else if (!std::strcmp(flag, "--no-gated")) {
            o.use_gated_activation = false;
        } else if (!std::strcmp(flag, "--layer-norm-epsilon")) {
            o.layer_norm_epsilon = to_float(flag, require_value(i, argc, argv));
        } else if (!std::strcmp(flag, "--seed")) {
            options.seed = static_cast<std::uint32_t>(to_int(flag, require_value(i, argc, argv)));
        } else if (!std::strcmp(flag, "--batch")) {
            options.batch = to_int(flag, require_value(i, argc, argv));
        } else if (!std::strcmp(flag, "--encoder-length")) {
            options.encoder_length = to_int(flag, require_value(i, argc, argv));
        } else if (!std::strcmp(flag, "--decoder-length")) {
            options.decoder_length = to_int(flag, require_value(i, argc, argv));
        } else if (!std::strcmp(flag, "--vocab")) {
            options.vocab_file = require_value(i, argc, argv);
        } else if (!std::strcmp(flag, "--text")) {
            options.text = require_value(i, argc, argv);
        } else if (!std::strcmp(flag, "--target")) {
            options.target = require_value(i, argc, argv);
        } else if (!std::strcmp(flag, "--list-presets")) {
            options.list_presets = true;
        } else if (!std::strcmp(flag, "--dump-config")) {
            options.dump_config = true;
        } else if (!std::strcmp(flag, "--verbose")) {
            options.verbose = true;
        } else if (!std::strcmp(flag, "--help") || !std::strcmp(flag, "-h")) {
            options.help = true;
        } else {
            throw ConfigError(std::string("unknown option ") + flag);
        }
    }

    if (options.batch < 1 || options.encoder_length < 1 || options.decoder_length < 1)
        throw ConfigError("--batch, --encoder-length and --decoder-length must be >= 1");
    return options;
}

void print_usage(const char* program)
{
    std::cout << "Usage: " << program << " [options]\n"
              << "  --preset NAME            start from a preset (see --list-presets)\n"
              << "  --config FILE            start from a JSON configuration file\n"
              << "  --num-layers N  --num-heads N  --vocabulary-size N\n"
              << "  --hidden-dim N  --intermediate-dim N  --dropout R\n"
              << "  --activation NAME  --gated | --no-gated  --layer-norm-epsilon E\n"
              << "  --seed N                 initializer seed (default 0)\n"
              << "  --batch N --encoder-length N --decoder-length N   random inputs\n"
              << "  --vocab FILE --text STR [--target STR]            tokenized inputs\n"
              << "  --list-presets  --dump-config  --verbose  --help\n";
}

BackboneConfig resolve_config(const RunOptions& options)
{
    BackboneConfig config;
    if (!options.preset.empty())
        config = get_preset(options.preset).config;
    if (!options.config_file.empty())
        config = BackboneConfig::load(options.config_file);

    const ConfigOverrides& o = options.overrides;
    if (o.num_layers)
        config.num_layers = *o.num_layers;
    if (o.num_heads)
        config.num_heads = *o.num_heads;
    if (o.vocabulary_size)
        config.vocabulary_size = *o.vocabulary_size;
    if (o.hidden_dim)
        config.hidden_dim = *o.hidden_dim;
    if (o.intermediate_dim)
        config.intermediate_dim = *o.intermediate_dim;
    if (o.dropout)
        config.dropout = *o.dropout;
    if (o.activation)
        config.activation = *o.activation;
    if (o.use_gated_activation)
        config.use_gated_activation = *o.use_gated_activation;
    if (o.layer_norm_epsilon)
        config.layer_norm_epsilon = *o.layer_norm_epsilon;

    config.validate();
    return config;
}

TensorMap make_random_inputs(int batch, int encoder_length, int decoder_length, int vocabulary_size,
                             std::uint32_t seed)
{
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> token(0, vocabulary_size - 1);

    Tensor encoder_ids({batch, encoder_length});
    Tensor decoder_ids({batch, decoder_length});
    for (float& id : encoder_ids.data)
        id = static_cast<float>(token(rng));
    for (float& id : decoder_ids.data)
        id = static_cast<float>(token(rng));

    TensorMap inputs;
    inputs["encoder_token_ids"] = encoder_ids;
    inputs["encoder_padding_mask"] = Tensor::ones({batch, encoder_length});
    inputs["decoder_token_ids"] = decoder_ids;
    inputs["decoder_padding_mask"] = Tensor::ones({batch, decoder_length});
    return inputs;
}

void print_output_summary(const TensorMap& outputs)
{
    for (const auto& entry : outputs) {
        const Tensor& t = entry.second;
        double sum = 0.0, sum_sq = 0.0;
        float lo = t.data.empty() ? 0.0f : t.data[0];
        float hi = lo;
        for (float v : t.data) {
            sum += v;
            sum_sq += static_cast<double>(v) * v;
            lo = std::min(lo, v);
            hi = std::max(hi, v);
        }
        const double n = t.data.empty() ? 1.0 : static_cast<double>(t.data.size());
        const double mean = sum / n;
        const double stddev = std::sqrt(std::max(0.0, sum_sq / n - mean * mean));
        std::printf("%s %s mean=%.6f std=%.6f min=%.6f max=%.6f\n", entry.first.c_str(),
                    t.shape_string().c_str(), mean, stddev, lo, hi);
    }
}

}
