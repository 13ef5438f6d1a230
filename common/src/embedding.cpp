#include "t5backbone/embedding.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace t5backbone {

Embedding::Embedding(int num_emb, int emb_dim, float init_stddev, std::mt19937& rng,
                     std::string layer_name)
    : num_embeddings(num_emb), embedding_dim(emb_dim), name(std::move(layer_name))
{
    weight = Tensor::truncated_normal({num_emb, emb_dim}, 0.0f, init_stddev, rng);
}

Tensor Embedding::forward(const Tensor& indices) const
{
    if (indices.rank() != 2)
        throw std::runtime_error("Embedding: expected [batch, seq] ids, got " +
                                 indices.shape_string());

    int batch = indices.shape[0];
    int seq_len = indices.shape[1];
    Tensor result({batch, seq_len, embedding_dim});

    for (int i = 0; i < batch * seq_len; i++) {
        float raw = indices.data[i];
        if (raw != std::floor(raw))
            throw std::runtime_error("Embedding: token id " + std::to_string(raw) +
                                     " is not an integer");
        // range check on the float; the cast below is only defined inside int range
        if (raw < 0.0f || raw >= static_cast<float>(num_embeddings))
            throw std::out_of_range("Embedding: token id " + std::to_string(raw) +
                                    " outside vocabulary of " + std::to_string(num_embeddings));
        int idx = static_cast<int>(raw);

        const float* row = weight.data.data() + static_cast<size_t>(idx) * embedding_dim;
        std::copy(row, row + embedding_dim, result.data.begin() + static_cast<size_t>(i) * embedding_dim);
    }

    return result;
}

}
