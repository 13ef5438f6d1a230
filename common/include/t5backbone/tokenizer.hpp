#ifndef T5BACKBONE_TOKENIZER_HPP
#define T5BACKBONE_TOKENIZER_HPP

#include "t5backbone/tensor.hpp"
#include <sentencepiece_processor.h>
#include <string>
#include <vector>

namespace t5backbone {

// SentencePiece vocabulary shipped with the T5 presets.
class T5Tokenizer {
public:
    explicit T5Tokenizer(const std::string& model_path);

    std::vector<int> encode(const std::string& text, bool add_eos = true) const;
    std::string decode(const std::vector<int>& ids) const;

    int pad_id() const { return pad_id_; }
    int eos_id() const { return eos_id_; }
    int vocabulary_size() const;

    // Right-pads id sequences with pad_id into [batch, max_len] ids and the
    // matching 0/1 padding mask.
    void to_batch(const std::vector<std::vector<int>>& sequences, Tensor& token_ids,
                  Tensor& padding_mask) const;

private:
    sentencepiece::SentencePieceProcessor sp_;
    int pad_id_;
    int eos_id_;
};

}

#endif
