#include "t5backbone/config.hpp"
#include "t5backbone/activation.hpp"
#include "t5backbone/errors.hpp"
#include "t5backbone/logging.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <set>
#include <sstream>

namespace t5backbone {

namespace {

int parse_int(const std::string& key, const std::string& value)
{
    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != value.size())
            throw std::invalid_argument(value);
        return parsed;
    } catch (const std::logic_error&) {
        throw ConfigError("'" + key + "' expects an integer, got '" + value + "'");
    }
}

float parse_float(const std::string& key, const std::string& value)
{
    try {
        size_t consumed = 0;
        float parsed = std::stof(value, &consumed);
        if (consumed != value.size())
            throw std::invalid_argument(value);
        return parsed;
    } catch (const std::logic_error&) {
        throw ConfigError("'" + key + "' expects a number, got '" + value + "'");
    }
}

bool parse_bool(const std::string& key, const std::string& value)
{
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "true" || lowered == "1")
        return true;
    if (lowered == "false" || lowered == "0")
        return false;
    throw ConfigError("'" + key + "' expects true or false, got '" + value + "'");
}

}

void BackboneConfig::validate() const
{
    if (num_layers < 1)
        throw ConfigError("num_layers must be >= 1, got " + std::to_string(num_layers));
    if (num_heads < 1)
        throw ConfigError("num_heads must be >= 1, got " + std::to_string(num_heads));
    if (vocabulary_size < 1)
        throw ConfigError("vocabulary_size must be >= 1, got " + std::to_string(vocabulary_size));
    if (hidden_dim < 1)
        throw ConfigError("hidden_dim must be >= 1, got " + std::to_string(hidden_dim));
    if (intermediate_dim < 1)
        throw ConfigError("intermediate_dim must be >= 1, got " + std::to_string(intermediate_dim));
    if (hidden_dim < num_heads)
        throw ConfigError("hidden_dim (" + std::to_string(hidden_dim) +
                          ") must be at least num_heads (" + std::to_string(num_heads) + ")");
    if (!(dropout >= 0.0f && dropout < 1.0f))
        throw ConfigError("dropout must be in [0, 1), got " + std::to_string(dropout));
    if (!(layer_norm_epsilon > 0.0f))
        throw ConfigError("layer_norm_epsilon must be > 0, got " + std::to_string(layer_norm_epsilon));
    if (!activation::is_known(activation))
        throw ConfigError("unknown activation '" + activation + "'");
}

std::string BackboneConfig::to_json() const
{
    std::ostringstream out;
    out.precision(9);
    out << "{\n";
    out << "  \"num_layers\": " << num_layers << ",\n";
    out << "  \"num_heads\": " << num_heads << ",\n";
    out << "  \"vocabulary_size\": " << vocabulary_size << ",\n";
    out << "  \"hidden_dim\": " << hidden_dim << ",\n";
    out << "  \"intermediate_dim\": " << intermediate_dim << ",\n";
    out << "  \"dropout\": " << dropout << ",\n";
    out << "  \"activation\": \"" << activation << "\",\n";
    out << "  \"use_gated_activation\": " << (use_gated_activation ? "true" : "false") << ",\n";
    out << "  \"layer_norm_epsilon\": " << layer_norm_epsilon << "\n";
    out << "}\n";
    return out.str();
}

BackboneConfig BackboneConfig::from_json(const std::string& text)
{
    BackboneConfig config;
    std::set<std::string> seen;

    std::string flattened = text;
    std::replace(flattened.begin(), flattened.end(), ',', '\n');
    std::replace(flattened.begin(), flattened.end(), '{', '\n');
    std::replace(flattened.begin(), flattened.end(), '}', '\n');

    std::istringstream stream(flattened);
    std::string line;
    while (std::getline(stream, line)) {
        line.erase(std::remove_if(line.begin(), line.end(),
                                  [](unsigned char c) { return std::isspace(c) != 0; }),
                   line.end());
        line.erase(std::remove(line.begin(), line.end(), '\"'), line.end());

        size_t colon = line.find(':');
        if (colon == std::string::npos)
            continue;

        std::string key = line.substr(0, colon);
        std::string value = line.substr(colon + 1);

        if (key == "num_layers") {
            config.num_layers = parse_int(key, value);
        } else if (key == "num_heads") {
            config.num_heads = parse_int(key, value);
        } else if (key == "vocabulary_size") {
            config.vocabulary_size = parse_int(key, value);
        } else if (key == "hidden_dim") {
            config.hidden_dim = parse_int(key, value);
        } else if (key == "intermediate_dim") {
            config.intermediate_dim = parse_int(key, value);
        } else if (key == "dropout") {
            config.dropout = parse_float(key, value);
        } else if (key == "activation") {
            config.activation = value;
        } else if (key == "use_gated_activation") {
            config.use_gated_activation = parse_bool(key, value);
        } else if (key == "layer_norm_epsilon") {
            config.layer_norm_epsilon = parse_float(key, value);
        } else {
            T5BACKBONE_LOG_DEBUG("config: ignoring key '%s'", key.c_str());
            continue;
        }
        seen.insert(key);
    }

    for (const char* required : {"num_layers", "num_heads", "vocabulary_size",
                                 "hidden_dim", "intermediate_dim"}) {
        if (!seen.count(required))
            throw ConfigError(std::string("missing required key '") + required + "'");
    }

    config.validate();
    return config;
}

BackboneConfig BackboneConfig::load(const std::string& filepath)
{
    std::ifstream file(filepath);
    if (!file.is_open())
        throw ConfigError("cannot open config file: " + filepath);

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

void BackboneConfig::save(const std::string& filepath) const
{
    std::ofstream file(filepath);
    if (!file.is_open())
        throw ConfigError("cannot write config file: " + filepath);
    file << to_json();
    if (!file)
        throw ConfigError("failed writing config file: " + filepath);
}

void BackboneConfig::print() const
{
    std::cout << "T5 Backbone Configuration:\n";
    std::cout << "  num_layers: " << num_layers << "\n";
    std::cout << "  num_heads: " << num_heads << "\n";
    std::cout << "  vocabulary_size: " << vocabulary_size << "\n";
    std::cout << "  hidden_dim: " << hidden_dim << "\n";
    std::cout << "  intermediate_dim: " << intermediate_dim << "\n";
    std::cout << "  dropout: " << dropout << "\n";
    std::cout << "  activation: " << activation << "\n";
    std::cout << "  use_gated_activation: " << (use_gated_activation ? "true" : "false") << "\n";
    std::cout << "  layer_norm_epsilon: " << layer_norm_epsilon << "\n";
}

bool operator==(const BackboneConfig& lhs, const BackboneConfig& rhs)
{
    return lhs.num_layers == rhs.num_layers &&
           lhs.num_heads == rhs.num_heads &&
           lhs.vocabulary_size == rhs.vocabulary_size &&
           lhs.hidden_dim == rhs.hidden_dim &&
           lhs.intermediate_dim == rhs.intermediate_dim &&
           lhs.dropout == rhs.dropout &&
           lhs.activation == rhs.activation &&
           lhs.use_gated_activation == rhs.use_gated_activation &&
           lhs.layer_norm_epsilon == rhs.layer_norm_epsilon;
}

bool operator!=(const BackboneConfig& lhs, const BackboneConfig& rhs)
{
    return !(lhs == rhs);
}

}
