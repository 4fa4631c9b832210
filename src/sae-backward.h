#pragma once

#include <cstdint>

struct ggml_context;
struct ggml_tensor;

// Sparse gradients of the encoder from the upstream gradient of the selected values.
//   indices     : [k, N] I32
//   grad_values : [k, N] F32

// grad_input [D, N]: grad_input[:, n] = sum_j grad_values[j, n] * weight[:, indices[j, n]]
ggml_tensor * sae_grad_input(
        ggml_context * ctx,
        ggml_tensor  * weight,
        ggml_tensor  * indices,
        ggml_tensor  * grad_values);

// grad_weight [D, M]: grad_weight[:, indices[j, n]] += grad_values[j, n] * input[:, n]
ggml_tensor * sae_grad_weight(
        ggml_context * ctx,
        ggml_tensor  * input,
        ggml_tensor  * indices,
        ggml_tensor  * grad_values,
        int64_t        n_latents);

// grad_bias [M]: grad_bias[indices[j, n]] += grad_values[j, n]
ggml_tensor * sae_grad_bias(
        ggml_context * ctx,
        ggml_tensor  * indices,
        ggml_tensor  * grad_values,
        int64_t        n_latents);
