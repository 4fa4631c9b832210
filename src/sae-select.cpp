#include "sae-select.h"

#include "ggml.h"

#include <algorithm>
#include <numeric>

static thread_local std::vector<int32_t> sae_select_order_tls;

void sae_select_topk_row(
        const float          * row,
        int64_t                M,
        int64_t                k,
        int32_t              * idx_out,
        std::vector<int32_t> & order) {
    GGML_ASSERT(k > 0 && k <= M);

    order.resize((size_t) M);
    std::iota(order.begin(), order.end(), 0);

    std::partial_sort(order.begin(), order.begin() + k, order.end(), [row](int32_t a, int32_t b) {
        if (row[a] != row[b]) {
            return row[a] > row[b];
        }
        return a < b;
    });

    std::copy(order.begin(), order.begin() + k, idx_out);
}

void sae_select_groupmax_row(
        const float * row,
        int64_t       M,
        int64_t       k,
        int32_t     * idx_out) {
    GGML_ASSERT(k > 0 && M % k == 0);

    const int64_t group = M / k;
    for (int64_t g = 0; g < k; ++g) {
        const int64_t off = g * group;
        int64_t best = 0;
        for (int64_t i = 1; i < group; ++i) {
            if (row[off + i] > row[off + best]) {
                best = i;
            }
        }
        // in-group argmax -> global latent id
        idx_out[g] = (int32_t) (off + best);
    }
}

// dst    : [k, N] I32
// src[0] : pre_acts [M, N] F32
static void sae_select_op(struct ggml_tensor * dst, int ith, int nth, void * userdata) {
    const auto * call = (const sae_encoder_call *) userdata;
    const ggml_tensor * pre = dst->src[0];

    GGML_ASSERT(call != nullptr);
    GGML_ASSERT(pre->type == GGML_TYPE_F32 && dst->type == GGML_TYPE_I32);
    GGML_ASSERT(ggml_is_contiguous(pre) && ggml_is_contiguous(dst));

    const int64_t M = pre->ne[0];
    const int64_t N = pre->ne[1];
    const int64_t k = dst->ne[0];

    GGML_ASSERT(dst->ne[1] == N);

    const int64_t n0 = (N * ith) / nth;
    const int64_t n1 = (N * (ith + 1)) / nth;

    const auto * pre_data = (const float *) pre->data;
    auto * idx_data       = (int32_t *) dst->data;

    for (int64_t n = n0; n < n1; ++n) {
        const float * row = pre_data + n * M;
        int32_t * out     = idx_data + n * k;
        switch (call->params.activation) {
            case sae_activation::topk:
                sae_select_topk_row(row, M, k, out, sae_select_order_tls);
                break;
            case sae_activation::groupmax:
                sae_select_groupmax_row(row, M, k, out);
                break;
        }
    }
}

// dst    : [k, N] F32
// src[0] : pre_acts [M, N] F32
// src[1] : indices  [k, N] I32
static void sae_gather_op(struct ggml_tensor * dst, int ith, int nth, void * userdata) {
    GGML_UNUSED(userdata);

    const ggml_tensor * pre = dst->src[0];
    const ggml_tensor * idx = dst->src[1];

    GGML_ASSERT(pre->type == GGML_TYPE_F32 && idx->type == GGML_TYPE_I32);
    GGML_ASSERT(ggml_is_contiguous(pre) && ggml_is_contiguous(idx) && ggml_is_contiguous(dst));

    const int64_t M = pre->ne[0];
    const int64_t N = pre->ne[1];
    const int64_t k = idx->ne[0];

    const int64_t n0 = (N * ith) / nth;
    const int64_t n1 = (N * (ith + 1)) / nth;

    const auto * pre_data = (const float *) pre->data;
    const auto * idx_data = (const int32_t *) idx->data;
    auto * dst_data       = (float *) dst->data;

    for (int64_t n = n0; n < n1; ++n) {
        for (int64_t j = 0; j < k; ++j) {
            const int32_t m = idx_data[n * k + j];
            GGML_ASSERT(m >= 0 && m < M);
            dst_data[n * k + j] = pre_data[n * M + m];
        }
    }
}

ggml_tensor * sae_select_indices(
        ggml_context           * ctx,
        ggml_tensor            * pre_acts,
        const sae_encoder_call & call) {
    const int64_t N = pre_acts->ne[1];
    const int64_t k = call.params.k;

    ggml_tensor * args[1] = { pre_acts };

    ggml_tensor * res = ggml_custom_4d(
            ctx, GGML_TYPE_I32,
            k, N, 1, 1,
            args, 1,
            sae_select_op,
            GGML_N_TASKS_MAX,
            (void *) &call);

    return res;
}

ggml_tensor * sae_gather_values(
        ggml_context * ctx,
        ggml_tensor  * pre_acts,
        ggml_tensor  * indices) {
    GGML_ASSERT(indices->ne[1] == pre_acts->ne[1]);

    ggml_tensor * args[2] = { pre_acts, indices };

    ggml_tensor * res = ggml_custom_4d(
            ctx, GGML_TYPE_F32,
            indices->ne[0], indices->ne[1], 1, 1,
            args, 2,
            sae_gather_op,
            GGML_N_TASKS_MAX,
            nullptr);

    return res;
}
