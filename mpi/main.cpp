#include "t5backbone/backbone.hpp"
#include "t5backbone/cli_options.hpp"
#include "t5backbone/logging.hpp"
#include "t5backbone/mpi_backend.hpp"
#include "t5backbone/presets.hpp"
#include <iostream>
#include <mpi.h>
#include <string>

using namespace t5backbone;

int main(int argc, char** argv)
{
    MPI_Init(&argc, &argv);

    int rank, world_size;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    MPI_Comm_size(MPI_COMM_WORLD, &world_size);
    log::set_prefix("[RANK " + std::to_string(rank) + "] ");

    try {
        RunOptions options = parse_run_options(argc, argv);
        if (options.verbose)
            log::set_level(log::Level::Debug);
        if (options.help || !options.vocab_file.empty()) {
            if (rank == 0) {
                print_usage(argv[0]);
                if (!options.vocab_file.empty())
                    std::cerr << "Tokenized input is only supported by t5backbone_run" << std::endl;
            }
            MPI_Finalize();
            return options.help ? 0 : 1;
        }

        if (options.list_presets || options.dump_config) {
            if (rank == 0) {
                if (options.list_presets) {
                    for (const std::string& name : preset_names())
                        std::cout << name << std::endl;
                } else {
                    std::cout << resolve_config(options).to_json() << std::endl;
                }
            }
            MPI_Finalize();
            return 0;
        }

        // only root's view of the options matters from here on
        BackboneConfig config;
        std::uint32_t seed = options.seed;
        if (rank == 0) {
            config = resolve_config(options);
            config.print();
        }
        mpi_backend::broadcast_config(config, seed, MPI_COMM_WORLD);

        T5Backbone backbone(config, seed);
        T5BACKBONE_LOG_DEBUG("Built backbone with %zu parameters", backbone.count_params());

        TensorMap inputs;
        if (rank == 0) {
            T5BACKBONE_LOG_INFO("Running batch of %d over %d processes", options.batch, world_size);
            inputs = make_random_inputs(options.batch, options.encoder_length, options.decoder_length,
                                        config.vocabulary_size, seed);
        }

        TensorMap outputs = mpi_backend::forward_data_parallel(backbone, inputs, MPI_COMM_WORLD);
        if (rank == 0)
            print_output_summary(outputs);

    } catch (const std::exception& e) {
        std::cerr << "[RANK " << rank << "] Error: " << e.what() << std::endl;
        MPI_Abort(MPI_COMM_WORLD, 1);
        return 1;
    }

    MPI_Finalize();
    return 0;
}
