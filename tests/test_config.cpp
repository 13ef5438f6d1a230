#include "test_runner.hpp"
#include "t5backbone/backbone.hpp"
#include "t5backbone/config.hpp"
#include "t5backbone/errors.hpp"
#include "t5backbone/presets.hpp"
#include <cstdio>
#include <fstream>
#include <string>

using namespace t5backbone;
using namespace t5backbone::testing;

static BackboneConfig valid_config()
{
    BackboneConfig config;
    config.num_layers = 2;
    config.num_heads = 2;
    config.vocabulary_size = 100;
    config.hidden_dim = 8;
    config.intermediate_dim = 16;
    return config;
}

static void test_defaults()
{
    BackboneConfig config;
    check_near(config.dropout, 0.1f, 0.0f, "default dropout");
    check_equal(config.activation, std::string("relu"), "default activation");
    check(!config.use_gated_activation, "not gated by default");
    check_near(config.layer_norm_epsilon, 1e-6f, 0.0f, "default epsilon");
    valid_config().validate();
}

static void test_invalid_values_rejected()
{
    auto expect_rejected = [](BackboneConfig config, const std::string& what) {
        check_throws<ConfigError>([&] { config.validate(); }, what);
    };

    BackboneConfig c = valid_config();
    c.num_layers = 0;
    expect_rejected(c, "num_layers = 0");
    c = valid_config();
    c.num_heads = 0;
    expect_rejected(c, "num_heads = 0");
    c = valid_config();
    c.vocabulary_size = 0;
    expect_rejected(c, "vocabulary_size = 0");
    c = valid_config();
    c.hidden_dim = -8;
    expect_rejected(c, "negative hidden_dim");
    c = valid_config();
    c.intermediate_dim = 0;
    expect_rejected(c, "intermediate_dim = 0");
    c = valid_config();
    c.hidden_dim = 1;
    expect_rejected(c, "hidden_dim smaller than num_heads");
    c = valid_config();
    c.dropout = 1.0f;
    expect_rejected(c, "dropout = 1");
    c = valid_config();
    c.dropout = -0.1f;
    expect_rejected(c, "negative dropout");
    c = valid_config();
    c.layer_norm_epsilon = 0.0f;
    expect_rejected(c, "zero epsilon");
    c = valid_config();
    c.activation = "tanhshrink";
    expect_rejected(c, "unknown activation");
}

static void test_json_round_trip()
{
    BackboneConfig config = valid_config();
    config.dropout = 0.25f;
    config.activation = "gelu_approximate";
    config.use_gated_activation = true;
    config.layer_norm_epsilon = 1e-5f;

    BackboneConfig parsed = BackboneConfig::from_json(config.to_json());
    check(parsed == config, "round trip preserves every field");
}

static void test_json_single_line_and_extra_keys()
{
    BackboneConfig parsed = BackboneConfig::from_json(
        "{\"name\": \"t5_backbone\", \"trainable\": true, \"num_layers\": 3, \"num_heads\": 4, "
        "\"vocabulary_size\": 50, \"hidden_dim\": 16, \"intermediate_dim\": 32}");
    check_equal(parsed.num_layers, 3, "num_layers");
    check_equal(parsed.num_heads, 4, "num_heads");
    check_equal(parsed.hidden_dim, 16, "hidden_dim");
    check_near(parsed.dropout, 0.1f, 0.0f, "missing optional key keeps default");
}

static void test_json_non_ascii_bytes()
{
    // UTF-8 text in an ignored key, plus tabs and CRLF line endings
    BackboneConfig parsed = BackboneConfig::from_json(
        "{\r\n\t\"description\": \"T5 \xc3\xa9t\xc3\xa9 \xe2\x80\x94 caf\xc3\xa9\",\r\n"
        "\t\"num_layers\": 2,\r\n\t\"num_heads\": 2,\r\n\t\"vocabulary_size\": 20,\r\n"
        "\t\"hidden_dim\": 8,\r\n\t\"intermediate_dim\": 16,\r\n\t\"activation\": \"relu\"\r\n}");
    check_equal(parsed.num_layers, 2, "num_layers");
    check_equal(parsed.vocabulary_size, 20, "vocabulary_size");
    check_equal(parsed.activation, std::string("relu"), "activation without trailing CR");
}

static void test_json_errors()
{
    check_throws<ConfigError>([] { BackboneConfig::from_json("{\"num_layers\": 2}"); },
                              "missing required keys");
    check_throws<ConfigError>(
        [] {
            BackboneConfig::from_json("{\"num_layers\": two, \"num_heads\": 2, \"vocabulary_size\": 10, "
                                      "\"hidden_dim\": 4, \"intermediate_dim\": 4}");
        },
        "non-numeric value");
    check_throws<ConfigError>(
        [] {
            BackboneConfig::from_json("{\"num_layers\": 0, \"num_heads\": 2, \"vocabulary_size\": 10, "
                                      "\"hidden_dim\": 4, \"intermediate_dim\": 4}");
        },
        "parsed values are validated");
    check_throws<ConfigError>([] { BackboneConfig::load("/nonexistent/t5_config.json"); },
                              "missing file");
}

static void test_save_and_load()
{
    BackboneConfig config = valid_config();
    const std::string path = "test_config_roundtrip.json";
    config.save(path);
    BackboneConfig loaded = BackboneConfig::load(path);
    std::remove(path.c_str());
    check(loaded == config, "file round trip");
}

static void test_rebuilt_topology_matches()
{
    BackboneConfig config = valid_config();
    T5Backbone original(config, 3);
    T5Backbone rebuilt(BackboneConfig::from_json(original.get_config().to_json()), 3);
    check(rebuilt.get_config() == original.get_config(), "same configuration");
    check_equal(rebuilt.count_params(), original.count_params(), "same parameter count");
    check_tensors_near(rebuilt.token_embedding().weight, original.token_embedding().weight, 0.0f,
                       "same seed, same weights");
}

static void test_presets_are_independent_copies()
{
    PresetMap first = T5Backbone::presets();
    PresetMap second = T5Backbone::presets();
    check(first.size() == 6, "six presets");
    check(first.at("t5_small_multi").config == second.at("t5_small_multi").config, "copies are equal");
    check(&first.at("t5_small_multi") != &second.at("t5_small_multi"), "copies are distinct objects");

    first.at("t5_small_multi").config.num_layers = 99;
    first.at("t5_small_multi").metadata.description = "mutated";
    first.erase("t5_base_multi");

    PresetMap third = T5Backbone::presets();
    check_equal(second.at("t5_small_multi").config.num_layers, 6, "other copy untouched");
    check_equal(third.at("t5_small_multi").config.num_layers, 6, "registry untouched");
    check(third.at("t5_small_multi").metadata.description != "mutated", "metadata untouched");
    check(third.count("t5_base_multi") == 1, "erase did not reach the registry");
}

static void test_preset_contents()
{
    for (const auto& entry : backbone_presets()) {
        entry.second.config.validate();
        check_equal(entry.second.config.vocabulary_size, 32128, entry.first + " vocabulary");
        check(!entry.second.vocabulary_file.empty(), entry.first + " has a vocabulary file");
    }

    Preset flan = get_preset("flan_small_multi");
    check(flan.config.use_gated_activation, "flan presets are gated");
    check_equal(flan.config.activation, std::string("gelu_approximate"), "flan activation");
    check_equal(flan.config.num_layers, 8, "flan small depth");

    check_throws<PresetNotFoundError>([] { get_preset("t5_huge"); }, "unknown preset");
    check_throws<PresetNotFoundError>([] { T5Backbone::from_preset("t5_huge"); },
                                      "unknown preset through the backbone");
}

int main()
{
    TestRunner runner("config and preset tests");
    runner.add_test("defaults", test_defaults);
    runner.add_test("invalid values rejected", test_invalid_values_rejected);
    runner.add_test("json round trip", test_json_round_trip);
    runner.add_test("json single line and extra keys", test_json_single_line_and_extra_keys);
    runner.add_test("json non-ascii bytes", test_json_non_ascii_bytes);
    runner.add_test("json errors", test_json_errors);
    runner.add_test("save and load", test_save_and_load);
    runner.add_test("rebuilt topology matches", test_rebuilt_topology_matches);
    runner.add_test("presets are independent copies", test_presets_are_independent_copies);
    runner.add_test("preset contents", test_preset_contents);
    runner.run_all_tests();
    return runner.exit_code();
}
