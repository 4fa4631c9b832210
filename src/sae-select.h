#pragma once

#include "sae-encoder.h"

#include <cstdint>
#include <vector>

// Row kernels. `row` holds M contiguous pre-activations, idx_out receives k global latent ids.
// topk returns the ids in descending value order (ties -> lower id first).
void sae_select_topk_row(
        const float          * row,
        int64_t                M,
        int64_t                k,
        int32_t              * idx_out,
        std::vector<int32_t> & order);

// groupmax returns one id per group, in group order (first maximum within a group).
void sae_select_groupmax_row(
        const float * row,
        int64_t       M,
        int64_t       k,
        int32_t     * idx_out);

// Custom op: indices [k, N] I32 selected from pre_acts [M, N] with call.params.activation.
ggml_tensor * sae_select_indices(
        ggml_context           * ctx,
        ggml_tensor            * pre_acts,
        const sae_encoder_call & call);

// Custom op: values [k, N] F32, values[j, n] = pre_acts[indices[j, n], n].
ggml_tensor * sae_gather_values(
        ggml_context * ctx,
        ggml_tensor  * pre_acts,
        ggml_tensor  * indices);
