#include "sae-backward.h"

#include "ggml.h"

#include <cstdint>
#include <cstring>
#include <vector>

static thread_local std::vector<float> sae_backward_row_tls;

// Row i1 of a 2-D F32/F16 tensor as contiguous floats. Returns a pointer into the tensor
// when it is already F32 and dense along ne0, otherwise converts into `buf`.
static const float * sae_row_f32(const ggml_tensor * t, int64_t i1, std::vector<float> & buf) {
    const int64_t n0 = t->ne[0];
    const uint8_t * base = (const uint8_t *) t->data + i1 * t->nb[1];

    if (t->type == GGML_TYPE_F32 && t->nb[0] == sizeof(float)) {
        return (const float *) base;
    }

    buf.resize((size_t) n0);
    for (int64_t i = 0; i < n0; ++i) {
        const uint8_t * p = base + i * t->nb[0];
        buf[(size_t) i] = t->type == GGML_TYPE_F16
                ? ggml_fp16_to_fp32(*(const ggml_fp16_t *) p)
                : *(const float *) p;
    }
    return buf.data();
}

// dst    : grad_input [D, N] F32
// src[0] : weight      [D, M] F32/F16
// src[1] : indices     [k, N] I32
// src[2] : grad_values [k, N] F32
static void sae_grad_input_op(struct ggml_tensor * dst, int ith, int nth, void * userdata) {
    GGML_UNUSED(userdata);

    const ggml_tensor * w    = dst->src[0];
    const ggml_tensor * idx  = dst->src[1];
    const ggml_tensor * gval = dst->src[2];

    GGML_ASSERT(w->type == GGML_TYPE_F32 || w->type == GGML_TYPE_F16);
    GGML_ASSERT(ggml_is_contiguous(idx) && ggml_is_contiguous(gval) && ggml_is_contiguous(dst));

    const int64_t D = w->ne[0];
    const int64_t M = w->ne[1];
    const int64_t k = idx->ne[0];
    const int64_t N = idx->ne[1];

    GGML_ASSERT(dst->ne[0] == D && dst->ne[1] == N);

    const int64_t n0 = (N * ith) / nth;
    const int64_t n1 = (N * (ith + 1)) / nth;

    const auto * idx_data  = (const int32_t *) idx->data;
    const auto * gval_data = (const float *) gval->data;
    auto * dst_data        = (float *) dst->data;

    for (int64_t n = n0; n < n1; ++n) {
        float * out = dst_data + n * D;
        std::memset(out, 0, (size_t) D * sizeof(float));

        // embedding-bag sum of the selected weight rows
        for (int64_t j = 0; j < k; ++j) {
            const int32_t m = idx_data[n * k + j];
            GGML_ASSERT(m >= 0 && m < M);
            const float g = gval_data[n * k + j];
            if (g == 0.0f) {
                continue;
            }
            const float * wrow = sae_row_f32(w, m, sae_backward_row_tls);
            for (int64_t d = 0; d < D; ++d) {
                out[d] += g * wrow[d];
            }
        }
    }
}

// dst    : grad_weight [D, M] F32
// src[0] : input       [D, N] F32
// src[1] : indices     [k, N] I32
// src[2] : grad_values [k, N] F32
//
// Each thread owns latents [m0, m1) of dst and accumulates every (n, j) that targets them,
// so repeated indices add up without atomics.
static void sae_grad_weight_op(struct ggml_tensor * dst, int ith, int nth, void * userdata) {
    GGML_UNUSED(userdata);

    const ggml_tensor * x    = dst->src[0];
    const ggml_tensor * idx  = dst->src[1];
    const ggml_tensor * gval = dst->src[2];

    GGML_ASSERT(x->type == GGML_TYPE_F32);
    GGML_ASSERT(ggml_is_contiguous(idx) && ggml_is_contiguous(gval) && ggml_is_contiguous(dst));

    const int64_t D = x->ne[0];
    const int64_t N = x->ne[1];
    const int64_t k = idx->ne[0];
    const int64_t M = dst->ne[1];

    GGML_ASSERT(dst->ne[0] == D && idx->ne[1] == N);

    const int64_t m0 = (M * ith) / nth;
    const int64_t m1 = (M * (ith + 1)) / nth;

    const auto * idx_data  = (const int32_t *) idx->data;
    const auto * gval_data = (const float *) gval->data;
    auto * dst_data        = (float *) dst->data;

    std::memset(dst_data + m0 * D, 0, (size_t) (m1 - m0) * (size_t) D * sizeof(float));

    for (int64_t n = 0; n < N; ++n) {
        const float * xrow = nullptr;
        for (int64_t j = 0; j < k; ++j) {
            const int32_t m = idx_data[n * k + j];
            GGML_ASSERT(m >= 0 && m < M);
            if (m < m0 || m >= m1) {
                continue;
            }
            const float g = gval_data[n * k + j];
            if (g == 0.0f) {
                continue;
            }
            if (!xrow) {
                xrow = sae_row_f32(x, n, sae_backward_row_tls);
            }
            float * out = dst_data + (int64_t) m * D;
            for (int64_t d = 0; d < D; ++d) {
                out[d] += g * xrow[d];
            }
        }
    }
}

// dst    : grad_bias   [M] F32
// src[0] : indices     [k, N] I32
// src[1] : grad_values [k, N] F32
static void sae_grad_bias_op(struct ggml_tensor * dst, int ith, int nth, void * userdata) {
    GGML_UNUSED(userdata);

    const ggml_tensor * idx  = dst->src[0];
    const ggml_tensor * gval = dst->src[1];

    GGML_ASSERT(ggml_is_contiguous(idx) && ggml_is_contiguous(gval) && ggml_is_contiguous(dst));

    const int64_t k = idx->ne[0];
    const int64_t N = idx->ne[1];
    const int64_t M = dst->ne[0];

    const int64_t m0 = (M * ith) / nth;
    const int64_t m1 = (M * (ith + 1)) / nth;

    const auto * idx_data  = (const int32_t *) idx->data;
    const auto * gval_data = (const float *) gval->data;
    auto * dst_data        = (float *) dst->data;

    for (int64_t m = m0; m < m1; ++m) {
        dst_data[m] = 0.0f;
    }

    for (int64_t i = 0; i < N * k; ++i) {
        const int32_t m = idx_data[i];
        GGML_ASSERT(m >= 0 && m < M);
        if (m >= m0 && m < m1) {
            dst_data[m] += gval_data[i];
        }
    }
}

ggml_tensor * sae_grad_input(
        ggml_context * ctx,
        ggml_tensor  * weight,
        ggml_tensor  * indices,
        ggml_tensor  * grad_values) {
    ggml_tensor * args[3] = { weight, indices, grad_values };

    ggml_tensor * res = ggml_custom_4d(
            ctx, GGML_TYPE_F32,
            weight->ne[0], indices->ne[1], 1, 1,
            args, 3,
            sae_grad_input_op,
            GGML_N_TASKS_MAX,
            nullptr);

    return res;
}

ggml_tensor * sae_grad_weight(
        ggml_context * ctx,
        ggml_tensor  * input,
        ggml_tensor  * indices,
        ggml_tensor  * grad_values,
        int64_t        n_latents) {
    ggml_tensor * args[3] = { input, indices, grad_values };

    ggml_tensor * res = ggml_custom_4d(
            ctx, GGML_TYPE_F32,
            input->ne[0], n_latents, 1, 1,
            args, 3,
            sae_grad_weight_op,
            GGML_N_TASKS_MAX,
            nullptr);

    return res;
}

ggml_tensor * sae_grad_bias(
        ggml_context * ctx,
        ggml_tensor  * indices,
        ggml_tensor  * grad_values,
        int64_t        n_latents) {
    ggml_tensor * args[2] = { indices, grad_values };

    ggml_tensor * res = ggml_custom_4d(
            ctx, GGML_TYPE_F32,
            n_latents, 1, 1, 1,
            args, 2,
            sae_grad_bias_op,
            GGML_N_TASKS_MAX,
            nullptr);

    return res;
}
