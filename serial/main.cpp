#include "t5backbone/backbone.hpp"
#include "t5backbone/cli_options.hpp"
#include "t5backbone/logging.hpp"
#include "t5backbone/presets.hpp"
#include "t5backbone/tokenizer.hpp"
#include <iostream>
#include <stdexcept>
#include <string>

using namespace t5backbone;

static TensorMap tokenize_inputs(const RunOptions& options, int vocabulary_size)
{
    T5Tokenizer tokenizer(options.vocab_file);
    if (tokenizer.vocabulary_size() > vocabulary_size) {
        T5BACKBONE_LOG_WARN("tokenizer has %d pieces but the model only embeds %d",
                            tokenizer.vocabulary_size(), vocabulary_size);
    }

    std::cout << "Input: " << options.text << std::endl;
    std::vector<int> source = tokenizer.encode(options.text, true);

    // without a target the decoder starts from the pad token, as T5 does
    std::vector<int> target = {tokenizer.pad_id()};
    if (!options.target.empty()) {
        std::cout << "Target: " << options.target << std::endl;
        target = tokenizer.encode(options.target, true);
    }

    TensorMap inputs;
    Tensor ids, mask;
    tokenizer.to_batch({source}, ids, mask);
    inputs["encoder_token_ids"] = ids;
    inputs["encoder_padding_mask"] = mask;
    tokenizer.to_batch({target}, ids, mask);
    inputs["decoder_token_ids"] = ids;
    inputs["decoder_padding_mask"] = mask;
    return inputs;
}

int main(int argc, char** argv)
{
    try {
        RunOptions options = parse_run_options(argc, argv);
        if (options.help) {
            print_usage(argv[0]);
            return 0;
        }
        if (options.verbose)
            log::set_level(log::Level::Debug);

        if (options.list_presets) {
            for (const auto& entry : backbone_presets()) {
                std::cout << entry.first << ": " << entry.second.metadata.description << std::endl;
            }
            return 0;
        }

        BackboneConfig config = resolve_config(options);
        if (options.dump_config) {
            std::cout << config.to_json() << std::endl;
            return 0;
        }
        config.print();

        T5Backbone backbone(config, options.seed);
        T5BACKBONE_LOG_INFO("Built backbone with %zu parameters", backbone.count_params());

        TensorMap inputs;
        if (!options.vocab_file.empty()) {
            if (options.text.empty())
                throw std::runtime_error("--vocab needs --text");
            inputs = tokenize_inputs(options, config.vocabulary_size);
        } else {
            inputs = make_random_inputs(options.batch, options.encoder_length, options.decoder_length,
                                        config.vocabulary_size, options.seed);
        }

        TensorMap outputs = backbone.forward(inputs);
        print_output_summary(outputs);

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
