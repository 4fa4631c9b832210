#pragma once

#include "sae-runner.h"

#include <vector>

// Dense host implementations used to check the fused graph.

// z = x W^T + b (N x M), accumulated in double.
sae_matrix sae_reference_linear(
        const sae_matrix         & input,
        const sae_matrix         & weight,
        const std::vector<float> * bias);

// relu(z), or clamp(z, 0, 6) for the quantized path before rounding.
sae_matrix sae_reference_rectify(const sae_matrix & z, bool bounded);

// Gradients of the dense computation with the upstream gradient scattered into a dense
// N x M matrix at the selected entries (rectifier and rounding treated as identity):
//   G = scatter(grad_values, indices),  grad_input = G W,  grad_weight = G^T X,  grad_bias = colsum(G)
sae_backward_result sae_reference_backward(
        const sae_matrix         & input,
        const sae_matrix         & weight,
        bool                       has_bias,
        const sae_forward_result & fwd,
        const sae_matrix         & grad_values);

double sae_max_abs_diff(const sae_matrix & a, const sae_matrix & b);
double sae_max_abs_diff(const std::vector<float> & a, const std::vector<float> & b);
