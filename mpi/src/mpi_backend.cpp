#include "t5backbone/mpi_backend.hpp"
#include "t5backbone/logging.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

namespace t5backbone {
namespace mpi_backend {

namespace {

void check(int rc, const char* what)
{
    if (rc != MPI_SUCCESS)
        throw std::runtime_error(std::string("MPI call failed: ") + what);
}

// Scatters rows of a [batch, length] tensor held by root.
Tensor scatter_rows(const Tensor* full, int length, const std::vector<int>& rows_per_rank,
                    int rank, MPI_Comm comm, int root)
{
    const int world_size = static_cast<int>(rows_per_rank.size());
    std::vector<int> counts(world_size), displs(world_size);
    int pos = 0;
    for (int r = 0; r < world_size; r++) {
        counts[r] = rows_per_rank[r] * length;
        displs[r] = pos;
        pos += counts[r];
    }

    Tensor local({rows_per_rank[rank], length});
    const float* send = (rank == root && full) ? full->data.data() : nullptr;
    check(MPI_Scatterv(send, counts.data(), displs.data(), MPI_FLOAT,
                       local.data.data(), counts[rank], MPI_FLOAT, root, comm),
          "MPI_Scatterv");
    return local;
}

// Gathers [rows, length, hidden] slices into [batch, length, hidden] on root.
Tensor gather_rows(const Tensor& local, int batch, int length, int hidden,
                   const std::vector<int>& rows_per_rank, int rank, MPI_Comm comm, int root)
{
    const int world_size = static_cast<int>(rows_per_rank.size());
    std::vector<int> counts(world_size), displs(world_size);
    int pos = 0;
    for (int r = 0; r < world_size; r++) {
        counts[r] = rows_per_rank[r] * length * hidden;
        displs[r] = pos;
        pos += counts[r];
    }

    Tensor full;
    if (rank == root)
        full = Tensor({batch, length, hidden});

    check(MPI_Gatherv(local.data.data(), counts[rank], MPI_FLOAT,
                      rank == root ? full.data.data() : nullptr, counts.data(), displs.data(),
                      MPI_FLOAT, root, comm),
          "MPI_Gatherv");
    return full;
}

}

RowPartition partition_rows(int rows, int rank, int world_size)
{
    if (world_size < 1 || rank < 0 || rank >= world_size || rows < 0)
        throw std::runtime_error("partition_rows: invalid arguments");

    int base = rows / world_size;
    int extra = rows % world_size;

    RowPartition part;
    part.count = base + (rank < extra ? 1 : 0);
    part.start = rank * base + std::min(rank, extra);
    return part;
}

void broadcast_config(BackboneConfig& config, std::uint32_t& seed, MPI_Comm comm, int root)
{
    int rank = 0;
    check(MPI_Comm_rank(comm, &rank), "MPI_Comm_rank");

    std::string text;
    int length = 0;
    if (rank == root) {
        text = config.to_json();
        length = static_cast<int>(text.size());
    }

    check(MPI_Bcast(&length, 1, MPI_INT, root, comm), "MPI_Bcast");
    text.resize(length);
    check(MPI_Bcast(&text[0], length, MPI_CHAR, root, comm), "MPI_Bcast");

    unsigned int seed_value = seed;
    check(MPI_Bcast(&seed_value, 1, MPI_UNSIGNED, root, comm), "MPI_Bcast");
    seed = seed_value;

    if (rank != root)
        config = BackboneConfig::from_json(text);
}

TensorMap forward_data_parallel(T5Backbone& backbone, const TensorMap& inputs, MPI_Comm comm,
                                int root)
{
    int rank = 0, world_size = 1;
    check(MPI_Comm_rank(comm, &rank), "MPI_Comm_rank");
    check(MPI_Comm_size(comm, &world_size), "MPI_Comm_size");

    // batch, encoder length, decoder length; batch = -1 reports a bad input on root
    int dims[3] = {-1, 0, 0};
    std::string root_error;
    if (rank == root) {
        try {
            const Tensor& enc_ids = inputs.at("encoder_token_ids");
            const Tensor& enc_mask = inputs.at("encoder_padding_mask");
            const Tensor& dec_ids = inputs.at("decoder_token_ids");
            const Tensor& dec_mask = inputs.at("decoder_padding_mask");
            if (enc_ids.rank() != 2 || dec_ids.rank() != 2 || enc_ids.shape != enc_mask.shape ||
                dec_ids.shape != dec_mask.shape || enc_ids.shape[0] != dec_ids.shape[0])
                throw std::runtime_error("inconsistent input shapes");
            dims[0] = enc_ids.shape[0];
            dims[1] = enc_ids.shape[1];
            dims[2] = dec_ids.shape[1];
        } catch (const std::out_of_range&) {
            root_error = "missing input";
        } catch (const std::runtime_error& e) {
            root_error = e.what();
        }
    }

    check(MPI_Bcast(dims, 3, MPI_INT, root, comm), "MPI_Bcast");
    if (dims[0] < 0) {
        throw std::runtime_error("forward_data_parallel: root rejected inputs" +
                                 (root_error.empty() ? std::string() : ": " + root_error));
    }

    const int batch = dims[0];
    const int encoder_length = dims[1];
    const int decoder_length = dims[2];
    const int hidden = backbone.get_config().hidden_dim;

    std::vector<int> rows_per_rank(world_size);
    for (int r = 0; r < world_size; r++)
        rows_per_rank[r] = partition_rows(batch, r, world_size).count;

    auto root_input = [&](const char* name) -> const Tensor* {
        return rank == root ? &inputs.at(name) : nullptr;
    };

    TensorMap local_inputs;
    local_inputs["encoder_token_ids"] =
        scatter_rows(root_input("encoder_token_ids"), encoder_length, rows_per_rank, rank, comm, root);
    local_inputs["encoder_padding_mask"] =
        scatter_rows(root_input("encoder_padding_mask"), encoder_length, rows_per_rank, rank, comm, root);
    local_inputs["decoder_token_ids"] =
        scatter_rows(root_input("decoder_token_ids"), decoder_length, rows_per_rank, rank, comm, root);
    local_inputs["decoder_padding_mask"] =
        scatter_rows(root_input("decoder_padding_mask"), decoder_length, rows_per_rank, rank, comm, root);

    const int local_rows = rows_per_rank[rank];
    T5BACKBONE_LOG_DEBUG("rows %d..%d of %d", partition_rows(batch, rank, world_size).start,
                         partition_rows(batch, rank, world_size).start + local_rows, batch);

    TensorMap local_outputs;
    int local_failed = 0;
    std::string local_error;
    try {
        if (local_rows > 0) {
            local_outputs = backbone.forward(local_inputs);
        } else {
            local_outputs["encoder_sequence_output"] = Tensor({0, encoder_length, hidden});
            local_outputs["decoder_sequence_output"] = Tensor({0, decoder_length, hidden});
        }
    } catch (const std::exception& e) {
        local_failed = 1;
        local_error = e.what();
    }

    // every rank must leave together, or the gathers below would hang
    int any_failed = 0;
    check(MPI_Allreduce(&local_failed, &any_failed, 1, MPI_INT, MPI_MAX, comm), "MPI_Allreduce");
    if (any_failed) {
        throw std::runtime_error("forward_data_parallel: " +
                                 (local_failed ? local_error : std::string("forward failed on another rank")));
    }

    Tensor encoder_output = gather_rows(local_outputs.at("encoder_sequence_output"), batch,
                                        encoder_length, hidden, rows_per_rank, rank, comm, root);
    Tensor decoder_output = gather_rows(local_outputs.at("decoder_sequence_output"), batch,
                                        decoder_length, hidden, rows_per_rank, rank, comm, root);

    TensorMap outputs;
    if (rank == root) {
        outputs.emplace("encoder_sequence_output", std::move(encoder_output));
        outputs.emplace("decoder_sequence_output", std::move(decoder_output));
    }
    return outputs;
}

}
}
