#include "test_runner.hpp"
#include "t5backbone/backbone.hpp"
#include "t5backbone/errors.hpp"
#include <algorithm>
#include <random>
#include <set>

using namespace t5backbone;
using namespace t5backbone::testing;

static BackboneConfig small_config()
{
    BackboneConfig config;
    config.num_layers = 2;
    config.num_heads = 2;
    config.vocabulary_size = 100;
    config.hidden_dim = 8;
    config.intermediate_dim = 16;
    return config;
}

static TensorMap make_inputs(int batch, int encoder_length, int decoder_length, int vocabulary_size,
                             unsigned seed)
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

static void test_end_to_end_shapes()
{
    T5Backbone backbone(small_config(), 1234);
    TensorMap outputs = backbone.forward(make_inputs(2, 5, 4, 100, 1));

    check_equal(outputs.size(), static_cast<size_t>(2), "two outputs");
    const Tensor& encoder_output = outputs.at("encoder_sequence_output");
    const Tensor& decoder_output = outputs.at("decoder_sequence_output");
    check(encoder_output.shape == std::vector<int>({2, 5, 8}), "encoder output [2, 5, 8]");
    check(decoder_output.shape == std::vector<int>({2, 4, 8}), "decoder output [2, 4, 8]");
    check(encoder_output.all_finite(), "encoder output has no NaN/Inf");
    check(decoder_output.all_finite(), "decoder output has no NaN/Inf");
}

static void test_input_output_names()
{
    const std::vector<std::string> expected_inputs = {
        "encoder_token_ids", "encoder_padding_mask", "decoder_token_ids", "decoder_padding_mask"};
    const std::vector<std::string> expected_outputs = {
        "encoder_sequence_output", "decoder_sequence_output"};
    check(T5Backbone::input_names() == expected_inputs, "input names");
    check(T5Backbone::output_names() == expected_outputs, "output names");

    BackboneConfig config = small_config();
    config.hidden_dim = 12;
    config.num_heads = 3;
    T5Backbone backbone(config, 7);
    TensorMap outputs = backbone.forward(make_inputs(1, 3, 2, 100, 2));
    std::set<std::string> keys;
    for (const auto& entry : outputs)
        keys.insert(entry.first);
    check(keys == std::set<std::string>(expected_outputs.begin(), expected_outputs.end()),
          "forward returns exactly the declared outputs");
    for (const auto& entry : outputs)
        check_equal(entry.second.shape.back(), 12, entry.first + " ends in hidden_dim");
}

static void test_missing_or_mismatched_inputs()
{
    T5Backbone backbone(small_config(), 1);
    TensorMap inputs = make_inputs(2, 5, 4, 100, 3);

    TensorMap missing = inputs;
    missing.erase("decoder_padding_mask");
    check_throws<std::runtime_error>([&] { backbone.forward(missing); }, "missing input");

    TensorMap bad_mask = inputs;
    bad_mask["encoder_padding_mask"] = Tensor::ones({2, 4});
    check_throws<std::runtime_error>([&] { backbone.forward(bad_mask); }, "mask shape differs from ids");

    TensorMap bad_batch = inputs;
    bad_batch["decoder_token_ids"] = Tensor({3, 4});
    bad_batch["decoder_padding_mask"] = Tensor::ones({3, 4});
    check_throws<std::runtime_error>([&] { backbone.forward(bad_batch); }, "batch sizes differ");

    TensorMap bad_rank = inputs;
    bad_rank["encoder_token_ids"] = Tensor({2, 5, 1});
    check_throws<std::runtime_error>([&] { backbone.forward(bad_rank); }, "rank 3 ids");

    TensorMap bad_token = inputs;
    bad_token["encoder_token_ids"].data[0] = 100.0f;
    check_throws<std::out_of_range>([&] { backbone.forward(bad_token); }, "token outside vocabulary");
}

static void test_invalid_construction()
{
    BackboneConfig config = small_config();
    config.num_layers = 0;
    check_throws<ConfigError>([&] { T5Backbone backbone(config); }, "num_layers = 0");

    config = small_config();
    config.vocabulary_size = 0;
    check_throws<ConfigError>([&] { T5Backbone backbone(config); }, "vocabulary_size = 0");

    config = small_config();
    config.hidden_dim = -4;
    check_throws<ConfigError>([&] { T5Backbone backbone(config); }, "negative hidden_dim");

    config = small_config();
    config.num_heads = 0;
    check_throws<ConfigError>([&] { T5Backbone backbone(config); }, "num_heads = 0");

    config = small_config();
    config.intermediate_dim = 0;
    check_throws<ConfigError>([&] { T5Backbone backbone(config); }, "intermediate_dim = 0");
}

static void test_shared_embedding()
{
    T5Backbone backbone(small_config(), 5);
    check(&backbone.encoder().embedding() == &backbone.token_embedding(), "encoder uses the shared table");
    check(&backbone.decoder().embedding() == &backbone.token_embedding(), "decoder uses the shared table");
    check_equal(backbone.token_embedding().name, std::string("token_embedding"), "embedding name");
    check(backbone.token_embedding().weight.shape == std::vector<int>({100, 8}), "table shape");

    Tensor ids({1, 3}, std::vector<float>{4, 42, 99});
    Tensor from_encoder = backbone.encoder().embedding().forward(ids);
    Tensor from_decoder = backbone.decoder().embedding().forward(ids);
    check(from_encoder.data == from_decoder.data, "bit-identical lookups");

    // an edit through the public handle is seen by both stacks
    backbone.token_embedding().weight.data[42 * 8] = 123.0f;
    check_near(backbone.encoder().embedding().forward(ids).data[8], 123.0f, 0.0f, "encoder sees the edit");
    check_near(backbone.decoder().embedding().forward(ids).data[8], 123.0f, 0.0f, "decoder sees the edit");
}

static void test_embedding_initializer()
{
    BackboneConfig config = small_config();
    config.vocabulary_size = 500;
    config.hidden_dim = 16;
    T5Backbone backbone(config, 11);
    const Tensor& weight = backbone.token_embedding().weight;
    float sum = 0.0f, sum_sq = 0.0f;
    for (float v : weight.data) {
        check(v >= -2.0f && v <= 2.0f, "truncated at two standard deviations");
        sum += v;
        sum_sq += v * v;
    }
    const float n = static_cast<float>(weight.size());
    const float variance = sum_sq / n - (sum / n) * (sum / n);
    // a unit normal truncated at +-2 has variance ~0.774
    check(variance > 0.65f && variance < 0.9f, "unit-scale truncated normal");
}

static void test_position_bias_shared_within_stack()
{
    BackboneConfig config = small_config();
    config.num_layers = 4;
    T5Backbone backbone(config, 21);
    BackboneTrace trace;
    backbone.forward(make_inputs(2, 5, 4, 100, 4), false, &trace);

    for (const StackTrace* stack : {&trace.encoder, &trace.decoder}) {
        check_equal(stack->consumed_position_bias.size(), static_cast<size_t>(4), "one entry per layer");
        check(!stack->consumed_position_bias[0], "layer 0 starts without a bias");
        const PositionBias& produced = stack->produced_position_bias[0];
        check(static_cast<bool>(produced), "layer 0 produces a bias");
        for (size_t i = 1; i < 4; i++) {
            check(stack->consumed_position_bias[i].get() == produced.get(),
                  "layer " + std::to_string(i) + " consumes layer 0's bias object");
            check(stack->produced_position_bias[i].get() == produced.get(),
                  "layer " + std::to_string(i) + " passes it on unchanged");
        }
    }

    check(trace.encoder.produced_position_bias[0].get() != trace.decoder.produced_position_bias[0].get(),
          "encoder and decoder keep separate biases");
    check(trace.encoder.produced_position_bias[0]->shape == std::vector<int>({2, 5, 5}), "encoder bias shape");
    check(trace.decoder.produced_position_bias[0]->shape == std::vector<int>({2, 4, 4}), "decoder bias shape");

    for (size_t i = 0; i < backbone.encoder().num_layers(); i++) {
        check(backbone.encoder().layer(i).use_relative_attention_bias() == (i == 0),
              "only encoder layer 0 owns a bias table");
        check(backbone.decoder().layer(i).use_relative_attention_bias() == (i == 0),
              "only decoder layer 0 owns a bias table");
        check(backbone.decoder().layer(i).is_decoder() && !backbone.encoder().layer(i).is_decoder(),
              "layer roles");
    }
    check_equal(backbone.decoder().layer(3).name(), std::string("transformer_decoder_layer_3"), "layer naming");
}

static void test_decoder_attention_mask()
{
    T5Backbone backbone(small_config(), 8);
    TensorMap inputs = make_inputs(2, 3, 4, 100, 5);
    inputs["decoder_padding_mask"] = Tensor({2, 4}, std::vector<float>{1, 1, 0, 0,
                                                                         1, 0, 1, 1});
    inputs["encoder_padding_mask"] = Tensor({2, 3}, std::vector<float>{1, 1, 0,
                                                                         1, 1, 1});
    BackboneTrace trace;
    backbone.forward(inputs, false, &trace);

    const Tensor& mask = trace.decoder.attention_mask;
    check(mask.shape == std::vector<int>({2, 4, 4}), "decoder mask shape");
    const Tensor& padding = inputs.at("decoder_padding_mask");
    for (int b = 0; b < 2; b++) {
        for (int i = 0; i < 4; i++) {
            for (int j = 0; j < 4; j++) {
                float expected = (j <= i && padding.data[b * 4 + j] != 0.0f) ? 1.0f : 0.0f;
                check_near(mask.data[(b * 4 + i) * 4 + j], expected, 0.0f, "causal AND padding");
            }
        }
    }

    check(trace.encoder.attention_mask.shape == std::vector<int>({2, 1, 3}), "encoder mask shape");
    check_tensors_near(trace.encoder.attention_mask.reshape({2, 3}), inputs.at("encoder_padding_mask"),
                       0.0f, "encoder mask is the padding mask");
}

static void test_padding_positions_do_not_leak()
{
    T5Backbone backbone(small_config(), 9);
    TensorMap inputs = make_inputs(1, 5, 3, 100, 6);
    inputs["encoder_padding_mask"] = Tensor({1, 5}, std::vector<float>{1, 1, 1, 0, 0});

    TensorMap first = backbone.forward(inputs);
    inputs["encoder_token_ids"].data[3] = 17.0f;
    inputs["encoder_token_ids"].data[4] = 18.0f;
    TensorMap second = backbone.forward(inputs);

    const Tensor& a = first.at("encoder_sequence_output");
    const Tensor& b = second.at("encoder_sequence_output");
    for (int i = 0; i < 3 * 8; i++)
        check_near(b.data[i], a.data[i], 1e-5f, "real encoder positions ignore padding tokens");
    check_tensors_near(second.at("decoder_sequence_output"), first.at("decoder_sequence_output"), 1e-5f,
                       "cross-attention ignores padded encoder positions");
}

static void test_decoder_is_causal()
{
    T5Backbone backbone(small_config(), 10);
    TensorMap inputs = make_inputs(1, 4, 4, 100, 7);
    TensorMap first = backbone.forward(inputs);

    inputs["decoder_token_ids"].data[3] = inputs["decoder_token_ids"].data[3] == 5.0f ? 6.0f : 5.0f;
    TensorMap second = backbone.forward(inputs);

    const Tensor& a = first.at("decoder_sequence_output");
    const Tensor& b = second.at("decoder_sequence_output");
    for (int i = 0; i < 3 * 8; i++)
        check_near(b.data[i], a.data[i], 1e-5f, "earlier positions do not see a later token");

    bool last_changed = false;
    for (int i = 3 * 8; i < 4 * 8; i++)
        last_changed |= a.data[i] != b.data[i];
    check(last_changed, "the changed position itself differs");
    check_tensors_near(second.at("encoder_sequence_output"), first.at("encoder_sequence_output"), 0.0f,
                       "encoder unaffected by decoder tokens");
}

static void test_empty_sequences()
{
    T5Backbone backbone(small_config(), 14);

    TensorMap empty_decoder = make_inputs(1, 3, 0, 100, 11);
    TensorMap outputs = backbone.forward(empty_decoder);
    check(outputs.at("decoder_sequence_output").shape == std::vector<int>({1, 0, 8}), "empty decoder output");
    check(outputs.at("encoder_sequence_output").shape == std::vector<int>({1, 3, 8}), "encoder still runs");

    TensorMap empty_encoder = make_inputs(1, 0, 2, 100, 12);
    outputs = backbone.forward(empty_encoder);
    check(outputs.at("encoder_sequence_output").shape == std::vector<int>({1, 0, 8}), "empty encoder output");
    check(outputs.at("decoder_sequence_output").shape == std::vector<int>({1, 2, 8}), "decoder output");
    check(outputs.at("decoder_sequence_output").all_finite(), "nothing to cross-attend to stays finite");
}

static void test_gated_gelu_variant()
{
    BackboneConfig config = small_config();
    config.activation = "keras_nlp>gelu_approximate";
    config.use_gated_activation = true;
    T5Backbone backbone(config, 12);
    TensorMap outputs = backbone.forward(make_inputs(2, 5, 4, 100, 8));
    check(outputs.at("encoder_sequence_output").all_finite(), "gated encoder output finite");
    check(outputs.at("decoder_sequence_output").all_finite(), "gated decoder output finite");
}

static void test_training_mode_dropout()
{
    BackboneConfig config = small_config();
    config.dropout = 0.5f;
    T5Backbone backbone(config, 13);
    TensorMap inputs = make_inputs(2, 5, 4, 100, 9);

    TensorMap inference_a = backbone.forward(inputs, false);
    TensorMap inference_b = backbone.forward(inputs, false);
    check_tensors_near(inference_a.at("decoder_sequence_output"), inference_b.at("decoder_sequence_output"),
                       0.0f, "inference is deterministic");

    TensorMap training = backbone.forward(inputs, true);
    const Tensor& trained = training.at("encoder_sequence_output");
    int zeros = 0;
    for (float v : trained.data)
        zeros += v == 0.0f;
    check(zeros > 0, "closing dropout zeroes some outputs in training");
    check(trained.all_finite(), "training output finite");
}

static void test_same_seed_same_model()
{
    T5Backbone a(small_config(), 99);
    T5Backbone b(small_config(), 99);
    T5Backbone c(small_config(), 100);
    TensorMap inputs = make_inputs(2, 5, 4, 100, 10);
    check_tensors_near(a.forward(inputs).at("decoder_sequence_output"),
                       b.forward(inputs).at("decoder_sequence_output"), 0.0f, "same seed");
    check(a.token_embedding().weight.data != c.token_embedding().weight.data, "different seed");
}

static void test_parameter_count()
{
    BackboneConfig config = small_config();
    T5Backbone backbone(config, 1);
    const size_t d = 8, f = 16, v = 100, h = 2, buckets = 32;
    const size_t attention = 4 * d * d;
    const size_t feedforward = 2 * d * f;
    const size_t encoder_layer = attention + feedforward + 2 * d;
    const size_t decoder_layer = 2 * attention + feedforward + 3 * d;
    const size_t expected = v * d + 2 * encoder_layer + 2 * decoder_layer + 2 * buckets * h + 2 * d;
    check_equal(backbone.count_params(), expected, "parameter count");

    check_equal(T5Backbone::presets().at("t5_small_multi").config.num_layers, 6, "preset registry");
    check_throws<PresetNotFoundError>([] { T5Backbone::from_preset("t5_tiny_multi"); },
                                      "from_preset with an unknown name");
}

int main()
{
    TestRunner runner("backbone tests");
    runner.add_test("end to end shapes", test_end_to_end_shapes);
    runner.add_test("input and output names", test_input_output_names);
    runner.add_test("missing or mismatched inputs", test_missing_or_mismatched_inputs);
    runner.add_test("invalid construction", test_invalid_construction);
    runner.add_test("shared embedding", test_shared_embedding);
    runner.add_test("embedding initializer", test_embedding_initializer);
    runner.add_test("position bias shared within stack", test_position_bias_shared_within_stack);
    runner.add_test("decoder attention mask", test_decoder_attention_mask);
    runner.add_test("padding positions do not leak", test_padding_positions_do_not_leak);
    runner.add_test("decoder is causal", test_decoder_is_causal);
    runner.add_test("empty sequences", test_empty_sequences);
    runner.add_test("gated gelu variant", test_gated_gelu_variant);
    runner.add_test("training mode dropout", test_training_mode_dropout);
    runner.add_test("same seed same model", test_same_seed_same_model);
    runner.add_test("parameter count", test_parameter_count);
    runner.run_all_tests();
    return runner.exit_code();
}
