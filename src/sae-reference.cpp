#include "sae-reference.h"

#include <algorithm>
#include <cmath>
#include <limits>

sae_matrix sae_reference_linear(
        const sae_matrix         & input,
        const sae_matrix         & weight,
        const std::vector<float> * bias) {
    const int64_t N = input.rows;
    const int64_t D = input.cols;
    const int64_t M = weight.rows;

    sae_matrix z(N, M);
    for (int64_t n = 0; n < N; ++n) {
        for (int64_t m = 0; m < M; ++m) {
            double acc = bias ? (double) (*bias)[(size_t) m] : 0.0;
            for (int64_t d = 0; d < D; ++d) {
                acc += (double) input.at(n, d) * (double) weight.at(m, d);
            }
            z.at(n, m) = (float) acc;
        }
    }
    return z;
}

sae_matrix sae_reference_rectify(const sae_matrix & z, bool bounded) {
    sae_matrix out = z;
    for (float & v : out.data) {
        v = std::max(v, 0.0f);
        if (bounded) {
            v = std::min(v, 6.0f);
        }
    }
    return out;
}

sae_backward_result sae_reference_backward(
        const sae_matrix         & input,
        const sae_matrix         & weight,
        bool                       has_bias,
        const sae_forward_result & fwd,
        const sae_matrix         & grad_values) {
    const int64_t N = input.rows;
    const int64_t D = input.cols;
    const int64_t M = weight.rows;
    const int64_t k = fwd.k;

    sae_matrix G(N, M);
    for (int64_t n = 0; n < N; ++n) {
        for (int64_t j = 0; j < k; ++j) {
            G.at(n, fwd.index(n, j)) += grad_values.at(n, j);
        }
    }

    sae_matrix gi(N, D);
    for (int64_t n = 0; n < N; ++n) {
        for (int64_t d = 0; d < D; ++d) {
            double acc = 0.0;
            for (int64_t m = 0; m < M; ++m) {
                acc += (double) G.at(n, m) * (double) weight.at(m, d);
            }
            gi.at(n, d) = (float) acc;
        }
    }

    sae_matrix gw(M, D);
    for (int64_t m = 0; m < M; ++m) {
        for (int64_t d = 0; d < D; ++d) {
            double acc = 0.0;
            for (int64_t n = 0; n < N; ++n) {
                acc += (double) G.at(n, m) * (double) input.at(n, d);
            }
            gw.at(m, d) = (float) acc;
        }
    }

    sae_backward_result res;
    res.grad_input  = std::move(gi);
    res.grad_weight = std::move(gw);

    if (has_bias) {
        std::vector<float> gb((size_t) M, 0.0f);
        for (int64_t m = 0; m < M; ++m) {
            double acc = 0.0;
            for (int64_t n = 0; n < N; ++n) {
                acc += (double) G.at(n, m);
            }
            gb[(size_t) m] = (float) acc;
        }
        res.grad_bias = std::move(gb);
    }
    return res;
}

double sae_max_abs_diff(const sae_matrix & a, const sae_matrix & b) {
    if (a.rows != b.rows || a.cols != b.cols) {
        return std::numeric_limits<double>::infinity();
    }
    return sae_max_abs_diff(a.data, b.data);
}

double sae_max_abs_diff(const std::vector<float> & a, const std::vector<float> & b) {
    if (a.size() != b.size()) {
        return std::numeric_limits<double>::infinity();
    }
    double max_diff = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        max_diff = std::max(max_diff, std::fabs((double) a[i] - (double) b[i]));
    }
    return max_diff;
}
