#include "t5backbone/tokenizer.hpp"
#include <algorithm>
#include <stdexcept>

namespace t5backbone {

T5Tokenizer::T5Tokenizer(const std::string& model_path)
{
    auto status = sp_.Load(model_path);
    if (!status.ok()) {
        throw std::runtime_error(
            "Failed to load SentencePiece model: " +
            std::string(status.message()));
    }

    pad_id_ = sp_.PieceToId("<pad>");
    eos_id_ = sp_.PieceToId("</s>");

    // PieceToId falls back to the unknown id for missing pieces
    if (pad_id_ < 0 || eos_id_ < 0 || pad_id_ == sp_.unk_id() || eos_id_ == sp_.unk_id()) {
        throw std::runtime_error(
            "Tokenizer does not contain <pad> or </s> pieces.");
    }
}

std::vector<int> T5Tokenizer::encode(const std::string& text, bool add_eos) const
{
    std::vector<int> ids;
    auto status = sp_.Encode(text, &ids);

    if (!status.ok()) {
        throw std::runtime_error(
            "SentencePiece encode failed: " +
            std::string(status.message()));
    }

    if (add_eos)
        ids.push_back(eos_id_);

    return ids;
}

std::string T5Tokenizer::decode(const std::vector<int>& ids) const
{
    std::string out;
    auto status = sp_.Decode(ids, &out);

    if (!status.ok()) {
        throw std::runtime_error(
            "SentencePiece decode failed: " +
            std::string(status.message()));
    }

    return out;
}

int T5Tokenizer::vocabulary_size() const
{
    return sp_.GetPieceSize();
}

void T5Tokenizer::to_batch(const std::vector<std::vector<int>>& sequences, Tensor& token_ids,
                           Tensor& padding_mask) const
{
    size_t max_len = 0;
    for (const auto& sequence : sequences)
        max_len = std::max(max_len, sequence.size());

    const int batch = static_cast<int>(sequences.size());
    const int length = static_cast<int>(max_len);
    token_ids = Tensor({batch, length}, static_cast<float>(pad_id_));
    padding_mask = Tensor({batch, length}, 0.0f);

    for (int b = 0; b < batch; b++) {
        for (size_t s = 0; s < sequences[b].size(); s++) {
            token_ids.data[b * length + s] = static_cast<float>(sequences[b][s]);
            padding_mask.data[b * length + s] = 1.0f;
        }
    }
}

}
