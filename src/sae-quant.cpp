#include "sae-quant.h"

#include "ggml.h"

#include <algorithm>
#include <atomic>
#include <cinttypes>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <random>

static const bool sae_quant_debug = std::getenv("SAE_ENCODER_DEBUG") != nullptr;
static std::atomic_flag sae_quant_clamp_warned = ATOMIC_FLAG_INIT;
static std::atomic<int64_t> sae_quant_clamp_count{0};

float sae_quant_round(float v, const sae_quant_params & q, float r) {
    const float span  = q.max_val - q.min_val;
    const float steps = (float) (q.levels - 1);

    const float s       = (v - q.min_val) * steps / span;
    const float floor_s = std::floor(s);
    const float frac    = s - floor_s;

    float level = r < frac ? floor_s + 1.0f : floor_s;
    level = std::min(std::max(level, 0.0f), steps);

    return level * span / steps + q.min_val;
}

static inline bool sae_quant_in_range(float v, const sae_quant_params & q) {
    return v >= q.min_val && v <= q.max_val;
}

void sae_quant_row(
        const float            * in,
        float                  * out,
        int64_t                  M,
        const sae_quant_params & q,
        uint64_t                 seed,
        int64_t                  row) {
    // one stream per row: independent of the thread split, uncorrelated across rows and seeds
    std::seed_seq seq{
        (uint32_t) (seed & 0xffffffffu), (uint32_t) (seed >> 32),
        (uint32_t) ((uint64_t) row & 0xffffffffu), (uint32_t) ((uint64_t) row >> 32),
    };
    std::mt19937 rng(seq);

    int64_t n_clamped = 0;
    for (int64_t i = 0; i < M; ++i) {
        // 24 random bits -> [0, 1)
        const float r = (float) (rng() >> 8) * (1.0f / 16777216.0f);
        if (!sae_quant_in_range(in[i], q)) {
            ++n_clamped;
        }
        out[i] = sae_quant_round(in[i], q, r);
    }

    if (n_clamped > 0) {
        sae_quant_clamp_count.fetch_add(n_clamped, std::memory_order_relaxed);
        if (!sae_quant_clamp_warned.test_and_set(std::memory_order_relaxed)) {
            std::fprintf(stderr,
                    "sae-quant: rectified values outside [%g, %g] were clamped to the grid ends\n",
                    (double) q.min_val, (double) q.max_val);
        }
    }
}

uint64_t sae_quant_fresh_seed() {
    std::random_device rd;
    return ((uint64_t) rd() << 32) ^ (uint64_t) rd();
}

// dst    : [M, N] F32
// src[0] : rectified pre-activations [M, N] F32
static void sae_quant_op(struct ggml_tensor * dst, int ith, int nth, void * userdata) {
    const auto * call = (const sae_encoder_call *) userdata;
    const ggml_tensor * src = dst->src[0];

    GGML_ASSERT(call != nullptr);
    GGML_ASSERT(src->type == GGML_TYPE_F32 && dst->type == GGML_TYPE_F32);
    GGML_ASSERT(ggml_is_contiguous(src) && ggml_is_contiguous(dst));
    GGML_ASSERT(call->params.quant.levels >= 2);

    const int64_t M = src->ne[0];
    const int64_t N = src->ne[1];

    const int64_t n0 = (N * ith) / nth;
    const int64_t n1 = (N * (ith + 1)) / nth;

    const auto * src_data = (const float *) src->data;
    auto * dst_data       = (float *) dst->data;

    for (int64_t n = n0; n < n1; ++n) {
        sae_quant_row(src_data + n * M, dst_data + n * M, M, call->params.quant, call->noise_seed, n);
    }

    if (sae_quant_debug && ith == 0) {
        std::fprintf(stderr, "sae-quant: seed=%016" PRIx64 " rows=%" PRId64 " levels=%d clamped_total=%" PRId64 "\n",
                call->noise_seed, N, call->params.quant.levels,
                sae_quant_clamp_count.load(std::memory_order_relaxed));
    }
}

ggml_tensor * sae_quantize(
        ggml_context           * ctx,
        ggml_tensor            * rectified,
        const sae_encoder_call & call) {
    ggml_tensor * args[1] = { rectified };

    ggml_tensor * res = ggml_custom_4d(
            ctx, GGML_TYPE_F32,
            rectified->ne[0], rectified->ne[1], 1, 1,
            args, 1,
            sae_quant_op,
            GGML_N_TASKS_MAX,
            (void *) &call);

    return res;
}
