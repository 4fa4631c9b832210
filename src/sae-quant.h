#pragma once

#include "sae-encoder.h"

#include <cstdint>

// Stochastic rounding of v onto `levels` points evenly spaced over [min_val, max_val].
// r is a uniform draw in [0, 1); the value rounds up with probability equal to the
// fractional part, so E[result] == v for v inside the grid range.
// Levels outside [0, levels-1] are clamped, so the result is always a grid point.
float sae_quant_round(float v, const sae_quant_params & q, float r);

// Quantizes one row of M values using the noise stream of (seed, row).
void sae_quant_row(
        const float            * in,
        float                  * out,
        int64_t                  M,
        const sae_quant_params & q,
        uint64_t                 seed,
        int64_t                  row);

// A fresh, unpredictable noise seed for one forward call.
uint64_t sae_quant_fresh_seed();

// Custom op: [M, N] F32 quantized copy of `rectified`, noise seeded by call.noise_seed.
ggml_tensor * sae_quantize(
        ggml_context           * ctx,
        ggml_tensor            * rectified,
        const sae_encoder_call & call);
