#include "sae-encoder.h"
#include "sae-quant.h"
#include "sae-runner.h"

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

bool on_grid(float v, const sae_quant_params & q) {
    const double s = (double) (v - q.min_val) * (q.levels - 1) / (double) (q.max_val - q.min_val);
    return std::fabs(s - std::round(s)) < 1e-4 && s > -1e-4 && s < (q.levels - 1) + 1e-4;
}

bool test_round_grid() {
    sae_quant_params q;
    q.min_val = 0.0f;
    q.max_val = 6.0f;
    q.levels  = 16;

    std::mt19937 rng(1);
    std::uniform_real_distribution<float> uv(-1.0f, 7.0f);
    std::uniform_real_distribution<float> ur(0.0f, 1.0f);
    for (int i = 0; i < 10000; ++i) {
        const float v = uv(rng);
        const float r = sae_quant_round(v, q, std::min(ur(rng), 0.99999994f));
        if (!on_grid(r, q)) {
            std::cerr << "round grid: " << v << " -> " << r << " is not a grid point\n";
            return false;
        }
    }

    // grid points are fixed, whatever the noise
    q.max_val = 15.0f;
    for (float r : { 0.0f, 0.5f, 0.999f }) {
        if (sae_quant_round(3.0f, q, r) != 3.0f) {
            std::cerr << "round grid: grid point moved with r = " << r << "\n";
            return false;
        }
    }
    if (sae_quant_round(3.25f, q, 0.1f) != 4.0f || sae_quant_round(3.25f, q, 0.9f) != 3.0f) {
        std::cerr << "round grid: wrong rounding direction around 3.25\n";
        return false;
    }
    return true;
}

bool test_unbiased() {
    sae_quant_params q;
    q.min_val = 0.0f;
    q.max_val = 15.0f;
    q.levels  = 16;

    const int64_t M = 1000;
    const float v = 2.3f;
    const std::vector<float> in(M, v);
    std::vector<float> out(M);

    double acc = 0.0;
    const int64_t n_rows = 40;
    for (int64_t row = 0; row < n_rows; ++row) {
        sae_quant_row(in.data(), out.data(), M, q, 1234, row);
        for (float o : out) {
            if (o != 2.0f && o != 3.0f) {
                std::cerr << "unbiased: " << v << " rounded to " << o << "\n";
                return false;
            }
            acc += o;
        }
    }
    const double mean = acc / (double) (M * n_rows);
    if (std::fabs(mean - v) > 0.02) {
        std::cerr << "unbiased: mean " << mean << " too far from " << v << "\n";
        return false;
    }
    return true;
}

bool test_invalid_params() {
    sae_encoder_params p;
    p.k = 2;
    p.quantization = true;

    bool ok = true;
    p.quant.levels = 1;
    try {
        sae_validate_params(p, 8);
        std::cerr << "invalid params: levels = 1 accepted\n";
        ok = false;
    } catch (const std::invalid_argument &) {
    }

    p.quant.levels  = 16;
    p.quant.min_val = 6.0f;
    p.quant.max_val = 6.0f;
    try {
        sae_validate_params(p, 8);
        std::cerr << "invalid params: max_val <= min_val accepted\n";
        ok = false;
    } catch (const std::invalid_argument &) {
    }

    // plain path ignores the quantization block
    p.quantization = false;
    try {
        sae_validate_params(p, 8);
    } catch (const std::invalid_argument & e) {
        std::cerr << "invalid params: plain path rejected: " << e.what() << "\n";
        ok = false;
    }
    return ok;
}

bool test_encoder_seeds() {
    std::mt19937 rng(9);
    const int64_t N = 12, D = 10, M = 64;
    const sae_matrix x = random_matrix(N, D, 1.0f, rng);
    const sae_matrix w = random_matrix(M, D, 0.5f, rng);
    const std::vector<float> b(M, 0.1f);

    sae_encoder_params params;
    params.k = 8;
    params.quantization = true;
    params.seed = 42;

    sae_host_options one;
    one.n_threads = 1;
    sae_host_options four;
    four.n_threads = 4;

    auto a = sae_encode(x, w, &b, params, one);
    auto c = sae_encode(x, w, &b, params, four);

    if (a->call().noise_seed != 42) {
        std::cerr << "seeds: pinned seed not used\n";
        return false;
    }
    if (a->output().pre_acts.data != c->output().pre_acts.data ||
        a->output().top_indices != c->output().top_indices) {
        std::cerr << "seeds: pinned seed gave different results across thread counts\n";
        return false;
    }
    for (float v : a->output().pre_acts.data) {
        if (!on_grid(v, params.quant)) {
            std::cerr << "seeds: pre_act " << v << " is not a grid point\n";
            return false;
        }
    }

    params.seed.reset();
    auto f1 = sae_encode(x, w, &b, params, one);
    auto f2 = sae_encode(x, w, &b, params, one);
    if (f1->call().noise_seed == f2->call().noise_seed ||
        f1->output().pre_acts.data == f2->output().pre_acts.data) {
        std::cerr << "seeds: two unseeded calls drew the same noise\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    bool ok = true;
    ok = test_round_grid()     && ok;
    ok = test_unbiased()       && ok;
    ok = test_invalid_params() && ok;
    ok = test_encoder_seeds()  && ok;
    std::fputs(ok ? "test-sae-quant: ok\n" : "test-sae-quant: failed\n", stdout);
    return ok ? 0 : 1;
}
