#ifndef T5BACKBONE_MASKS_HPP
#define T5BACKBONE_MASKS_HPP

#include "t5backbone/tensor.hpp"

namespace t5backbone {

// [batch, output_length, input_length]; 1 where i + cache_index >= j.
Tensor compute_causal_mask(int batch_size, int output_length, int input_length, int cache_index = 0);

// [batch, length] padding mask -> [batch, 1, length] with values 0/1.
Tensor expand_padding_mask(const Tensor& padding_mask);

// Logical AND of two [batch, rows, length] masks; a rows dimension of 1 is
// broadcast against the other operand.
Tensor merge_masks(const Tensor& lhs, const Tensor& rhs);

}

#endif
