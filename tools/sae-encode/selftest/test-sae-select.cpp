#include "sae-encoder.h"
#include "sae-reference.h"
#include "sae-runner.h"
#include "sae-select.h"
#include "sae-stats.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iostream>
#include <random>
#include <stdexcept>
#include <vector>

namespace {

sae_matrix random_matrix(int64_t rows, int64_t cols, float scale, std::mt19937 & rng) {
    sae_matrix m(rows, cols);
    std::normal_distribution<float> nd(0.0f, scale);
    for (float & v : m.data) v = nd(rng);
    return m;
}

template <typename E, typename F>
bool expect_throw(const char * what, F && fn) {
    try {
        fn();
    } catch (const E &) {
        return true;
    } catch (const std::exception & e) {
        std::cerr << what << ": unexpected exception type: " << e.what() << "\n";
        return false;
    }
    std::cerr << what << ": expected an exception\n";
    return false;
}

bool test_topk_row_kernel() {
    const std::vector<float> row = { 0.5f, 2.0f, -1.0f, 2.0f, 7.0f, 0.0f };
    std::vector<int32_t> order;
    int32_t idx[3];
    sae_select_topk_row(row.data(), (int64_t) row.size(), 3, idx, order);
    // ties go to the lower id
    if (idx[0] != 4 || idx[1] != 1 || idx[2] != 3) {
        std::cerr << "topk row: got " << idx[0] << " " << idx[1] << " " << idx[2] << "\n";
        return false;
    }

    int32_t g[2];
    sae_select_groupmax_row(row.data(), (int64_t) row.size(), 2, g);
    if (g[0] != 1 || g[1] != 4) {
        std::cerr << "groupmax row: got " << g[0] << " " << g[1] << "\n";
        return false;
    }
    return true;
}

bool test_topk_properties() {
    std::mt19937 rng(7);
    const int64_t N = 24, D = 16, M = 48, k = 5;
    const sae_matrix x = random_matrix(N, D, 1.0f, rng);
    const sae_matrix w = random_matrix(M, D, 0.25f, rng);
    const std::vector<float> b(M, 0.01f);

    sae_encoder_params params;
    params.k = k;
    sae_host_options opt;
    opt.n_threads = 3;

    auto call = sae_encode(x, w, &b, params, opt);
    const sae_forward_result & fwd = call->output();

    const sae_matrix ref = sae_reference_rectify(sae_reference_linear(x, w, &b), false);
    if (sae_max_abs_diff(ref, fwd.pre_acts) > 1e-4) {
        std::cerr << "topk: pre_acts differ from the dense reference\n";
        return false;
    }

    for (int64_t n = 0; n < N; ++n) {
        std::vector<bool> picked(M, false);
        float min_sel = INFINITY;
        for (int64_t j = 0; j < k; ++j) {
            const int32_t m = fwd.index(n, j);
            if (m < 0 || m >= M || picked[m]) {
                std::cerr << "topk: bad or repeated index " << m << " in row " << n << "\n";
                return false;
            }
            picked[m] = true;
            if (fwd.top_acts.at(n, j) != fwd.pre_acts.at(n, m)) {
                std::cerr << "topk: value does not match pre_acts at row " << n << "\n";
                return false;
            }
            if (j > 0 && fwd.top_acts.at(n, j) > fwd.top_acts.at(n, j - 1)) {
                std::cerr << "topk: values not in descending order at row " << n << "\n";
                return false;
            }
            min_sel = std::min(min_sel, fwd.top_acts.at(n, j));
        }
        for (int64_t m = 0; m < M; ++m) {
            if (!picked[m] && fwd.pre_acts.at(n, m) > min_sel) {
                std::cerr << "topk: latent " << m << " larger than a selected one in row " << n << "\n";
                return false;
            }
        }
    }
    return true;
}

bool test_groupmax_properties() {
    std::mt19937 rng(11);
    const int64_t N = 16, D = 8, M = 40, k = 8;
    const int64_t G = M / k;
    const sae_matrix x = random_matrix(N, D, 1.0f, rng);
    const sae_matrix w = random_matrix(M, D, 0.5f, rng);

    sae_encoder_params params;
    params.k = k;
    params.activation = sae_activation::groupmax;

    auto call = sae_encode(x, w, nullptr, params);
    const sae_forward_result & fwd = call->output();

    for (int64_t n = 0; n < N; ++n) {
        for (int64_t j = 0; j < k; ++j) {
            const int32_t m = fwd.index(n, j);
            if (m < j * G || m >= (j + 1) * G) {
                std::cerr << "groupmax: index " << m << " outside group " << j << "\n";
                return false;
            }
            float gmax = -INFINITY;
            for (int64_t i = j * G; i < (j + 1) * G; ++i) gmax = std::max(gmax, fwd.pre_acts.at(n, i));
            if (fwd.top_acts.at(n, j) != gmax) {
                std::cerr << "groupmax: value is not the group maximum (row " << n << ", group " << j << ")\n";
                return false;
            }
        }
    }
    return true;
}

// weight = first three columns of I_4, zero bias
bool test_concrete_case() {
    sae_matrix x(2, 3);
    x.data = { 1.0f, 2.0f, 3.0f,
               3.0f, -1.0f, 2.0f };
    sae_matrix w(4, 3);
    w.data = { 1.0f, 0.0f, 0.0f,
               0.0f, 1.0f, 0.0f,
               0.0f, 0.0f, 1.0f,
               0.0f, 0.0f, 0.0f };
    const std::vector<float> b(4, 0.0f);

    sae_encoder_params params;
    params.k = 2;

    auto call = sae_encode(x, w, &b, params);
    const sae_forward_result & fwd = call->output();

    const std::vector<float>   want_vals = { 3.0f, 2.0f, 3.0f, 2.0f };
    const std::vector<int32_t> want_idx  = { 2, 1, 0, 2 };
    if (fwd.top_acts.data != want_vals || fwd.top_indices != want_idx) {
        std::cerr << "concrete topk: unexpected values or indices\n";
        return false;
    }

    params.activation = sae_activation::groupmax;
    auto gcall = sae_encode(x, w, &b, params);
    const std::vector<float>   want_gvals = { 2.0f, 3.0f, 3.0f, 2.0f };
    const std::vector<int32_t> want_gidx  = { 1, 2, 0, 2 };
    if (gcall->output().top_acts.data != want_gvals || gcall->output().top_indices != want_gidx) {
        std::cerr << "concrete groupmax: unexpected values or indices\n";
        return false;
    }
    return true;
}

bool test_invalid_arguments() {
    std::mt19937 rng(3);
    const sae_matrix x = random_matrix(2, 3, 1.0f, rng);
    const sae_matrix w = random_matrix(4, 3, 1.0f, rng);

    bool ok = true;
    ok = ok && expect_throw<std::invalid_argument>("bogus activation", [] {
        sae_activation_from_string("bogus");
    });
    ok = ok && expect_throw<std::invalid_argument>("groupmax uneven split", [&] {
        sae_encoder_params p;
        p.k = 3;
        p.activation = sae_activation::groupmax;
        sae_encode(x, w, nullptr, p);
    });
    ok = ok && expect_throw<std::invalid_argument>("k = 0", [&] {
        sae_encoder_params p;
        p.k = 0;
        sae_encode(x, w, nullptr, p);
    });
    ok = ok && expect_throw<std::invalid_argument>("k > M", [&] {
        sae_encoder_params p;
        p.k = 5;
        sae_encode(x, w, nullptr, p);
    });
    ok = ok && expect_throw<sae_dimension_error>("feature mismatch", [&] {
        sae_encoder_params p;
        p.k = 2;
        const sae_matrix w2 = random_matrix(4, 5, 1.0f, rng);
        sae_encode(x, w2, nullptr, p);
    });
    ok = ok && expect_throw<sae_dimension_error>("bias length", [&] {
        sae_encoder_params p;
        p.k = 2;
        const std::vector<float> b(3, 0.0f);
        sae_encode(x, w, &b, p);
    });
    return ok;
}

bool test_latent_stats() {
    std::mt19937 rng(5);
    const int64_t N = 10, D = 6, M = 12, k = 3;
    const sae_matrix x = random_matrix(N, D, 1.0f, rng);
    const sae_matrix w = random_matrix(M, D, 1.0f, rng);

    sae_encoder_params params;
    params.k = k;
    auto call = sae_encode(x, w, nullptr, params);

    sae_latent_stats stats;
    sae_latent_stats_add(stats, call->output());
    sae_latent_stats_add(stats, call->output());

    int64_t total = 0;
    for (int64_t c : stats.fire_count) total += c;
    if (stats.n_samples != 2 * N || total != 2 * N * k) {
        std::cerr << "latent stats: expected " << 2 * N * k << " selections, got " << total << "\n";
        return false;
    }
    if (stats.n_dead() < 0 || stats.n_dead() > M - k) {
        std::cerr << "latent stats: implausible dead count " << stats.n_dead() << "\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    bool ok = true;
    ok = test_topk_row_kernel()     && ok;
    ok = test_topk_properties()     && ok;
    ok = test_groupmax_properties() && ok;
    ok = test_concrete_case()       && ok;
    ok = test_invalid_arguments()   && ok;
    ok = test_latent_stats()        && ok;
    std::fputs(ok ? "test-sae-select: ok\n" : "test-sae-select: failed\n", stdout);
    return ok ? 0 : 1;
}
