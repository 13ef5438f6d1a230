#ifndef T5BACKBONE_EMBEDDING_HPP
#define T5BACKBONE_EMBEDDING_HPP

#include "t5backbone/tensor.hpp"
#include <random>
#include <string>

namespace t5backbone {

class Embedding {
public:
    Tensor weight;
    int num_embeddings;
    int embedding_dim;
    std::string name;

    // Truncated-normal table with the given standard deviation.
    Embedding(int num_emb, int emb_dim, float init_stddev, std::mt19937& rng,
              std::string layer_name = "token_embedding");

    // [batch, seq] ids -> [batch, seq, embedding_dim]
    Tensor forward(const Tensor& indices) const;

    int num_params() const { return weight.size(); }
};

}

#endif
