#include "t5backbone/masks.hpp"
#include <algorithm>
#include <stdexcept>

namespace t5backbone {

Tensor compute_causal_mask(int batch_size, int output_length, int input_length, int cache_index)
{
    if (batch_size < 0 || output_length < 0 || input_length < 0)
        throw std::runtime_error("compute_causal_mask: negative dimension");

    Tensor mask({batch_size, output_length, input_length});
    const int plane = output_length * input_length;
    if (batch_size == 0)
        return mask;

    for (int i = 0; i < output_length; i++)
        for (int j = 0; j < input_length; j++)
            mask.data[i * input_length + j] = (i + cache_index >= j) ? 1.0f : 0.0f;

    for (int b = 1; b < batch_size; b++)
        std::copy(mask.data.begin(), mask.data.begin() + plane, mask.data.begin() + b * plane);

    return mask;
}

Tensor expand_padding_mask(const Tensor& padding_mask)
{
    if (padding_mask.rank() != 2)
        throw std::runtime_error("expand_padding_mask: expected [batch, length], got " +
                                 padding_mask.shape_string());

    Tensor expanded({padding_mask.shape[0], 1, padding_mask.shape[1]});
    for (int i = 0; i < padding_mask.size(); i++)
        expanded.data[i] = padding_mask.data[i] != 0.0f ? 1.0f : 0.0f;
    return expanded;
}

Tensor merge_masks(const Tensor& lhs, const Tensor& rhs)
{
    if (lhs.rank() != 3 || rhs.rank() != 3 || lhs.shape[0] != rhs.shape[0] ||
        lhs.shape[2] != rhs.shape[2])
        throw std::runtime_error("merge_masks: incompatible masks " + lhs.shape_string() +
                                 " and " + rhs.shape_string());

    const int lhs_rows = lhs.shape[1];
    const int rhs_rows = rhs.shape[1];
    if (lhs_rows != rhs_rows && lhs_rows != 1 && rhs_rows != 1)
        throw std::runtime_error("merge_masks: cannot broadcast " + lhs.shape_string() +
                                 " with " + rhs.shape_string());

    const int batch = lhs.shape[0];
    const int rows = std::max(lhs_rows, rhs_rows);
    const int length = lhs.shape[2];

    Tensor merged({batch, rows, length});
    for (int b = 0; b < batch; b++) {
        for (int i = 0; i < rows; i++) {
            const float* l = lhs.data.data() + (b * lhs_rows + (lhs_rows == 1 ? 0 : i)) * length;
            const float* r = rhs.data.data() + (b * rhs_rows + (rhs_rows == 1 ? 0 : i)) * length;
            float* out = merged.data.data() + (b * rows + i) * length;
            for (int j = 0; j < length; j++)
                out[j] = (l[j] != 0.0f && r[j] != 0.0f) ? 1.0f : 0.0f;
        }
    }
    return merged;
}

}
