#ifndef T5BACKBONE_MPI_BACKEND_HPP
#define T5BACKBONE_MPI_BACKEND_HPP

#include "t5backbone/backbone.hpp"
#include "t5backbone/config.hpp"
#include <cstdint>
#include <mpi.h>

namespace t5backbone {
namespace mpi_backend {

struct RowPartition {
    int start;
    int count;
};

// Contiguous split of `rows` over `world_size` ranks; the first
// rows % world_size ranks take one extra row.
RowPartition partition_rows(int rows, int rank, int world_size);

// Root's configuration and seed overwrite everyone else's. Identical seeds
// give identical weights on every rank.
void broadcast_config(BackboneConfig& config, std::uint32_t& seed, MPI_Comm comm, int root = 0);

// Splits the batch of `inputs` (only read on root) across the ranks of comm,
// runs backbone.forward on each slice and gathers the outputs on root.
// Non-root ranks get an empty map. Every rank must hold a backbone built from
// the same configuration and seed.
TensorMap forward_data_parallel(T5Backbone& backbone, const TensorMap& inputs, MPI_Comm comm,
                                int root = 0);

}
}

#endif
