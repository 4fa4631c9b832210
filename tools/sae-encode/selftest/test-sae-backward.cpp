#include "sae-encoder.h"
#include "sae-reference.h"
#include "sae-runner.h"

#include "ggml.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace {

sae_matrix random_matrix(int64_t rows, int64_t cols, float scale, std::mt19937 & rng) {
    sae_matrix m(rows, cols);
    std::normal_distribution<float> nd(0.0f, scale);
    for (float & v : m.data) v = nd(rng);
    return m;
}

double max_abs(const std::vector<float> & v) {
    double m = 0.0;
    for (float x : v) m = std::max(m, (double) std::fabs(x));
    return m;
}

bool close(const char * what, const std::string & tag, double diff, double scale) {
    if (diff > 1e-4 * std::max(1.0, scale)) {
        std::cerr << "backward " << tag << ": " << what << " differs from the dense reference by " << diff << "\n";
        return false;
    }
    return true;
}

struct grad_case {
    sae_activation activation = sae_activation::topk;
    bool quantization = false;
    bool bias         = true;
    bool weight_f16   = false;
    int  n_threads    = 1;
};

bool check_case(const grad_case & gc, const std::string & tag) {
    std::mt19937 rng(17);
    const int64_t N = 20, D = 12, M = 36, k = 6;

    const sae_matrix x = random_matrix(N, D, 1.0f, rng);
    sae_matrix w = random_matrix(M, D, 0.3f, rng);
    const std::vector<float> b = random_matrix(1, M, 0.05f, rng).data;
    const sae_matrix gv = random_matrix(N, k, 1.0f, rng);

    sae_encoder_params params;
    params.k = k;
    params.activation = gc.activation;
    params.quantization = gc.quantization;
    params.seed = 5;

    sae_host_options opt;
    opt.n_threads  = gc.n_threads;
    opt.weight_f16 = gc.weight_f16;

    auto call = sae_encode(x, w, gc.bias ? &b : nullptr, params, opt);
    const sae_backward_result got = call->backward(gv, sae_grad_request{});

    if (gc.weight_f16) {
        for (float & v : w.data) v = ggml_fp16_to_fp32(ggml_fp32_to_fp16(v));
    }
    const sae_backward_result ref = sae_reference_backward(x, w, gc.bias, call->output(), gv);

    if (!got.grad_input || !got.grad_weight) {
        std::cerr << "backward " << tag << ": missing gradients\n";
        return false;
    }
    bool ok = true;
    ok = close("grad_input",  tag, sae_max_abs_diff(*got.grad_input,  *ref.grad_input),  max_abs(ref.grad_input->data))  && ok;
    ok = close("grad_weight", tag, sae_max_abs_diff(*got.grad_weight, *ref.grad_weight), max_abs(ref.grad_weight->data)) && ok;
    if (gc.bias) {
        if (!got.grad_bias) {
            std::cerr << "backward " << tag << ": missing grad_bias\n";
            return false;
        }
        ok = close("grad_bias", tag, sae_max_abs_diff(*got.grad_bias, *ref.grad_bias), max_abs(*ref.grad_bias)) && ok;
    } else if (got.grad_bias) {
        std::cerr << "backward " << tag << ": grad_bias produced for an encoder without bias\n";
        ok = false;
    }
    return ok;
}

bool test_against_reference() {
    bool ok = true;
    for (sae_activation act : { sae_activation::topk, sae_activation::groupmax }) {
        for (bool quant : { false, true }) {
            grad_case gc;
            gc.activation   = act;
            gc.quantization = quant;
            gc.n_threads    = 2;
            const std::string tag = std::string(sae_activation_name(act)) + (quant ? "/quant" : "/plain");
            ok = check_case(gc, tag) && ok;
        }
    }

    grad_case no_bias;
    no_bias.bias = false;
    ok = check_case(no_bias, "no-bias") && ok;

    grad_case f16;
    f16.weight_f16 = true;
    f16.n_threads  = 3;
    ok = check_case(f16, "f16") && ok;
    return ok;
}

// identical rows select identical latents, so every selected latent collects N contributions
bool test_collisions() {
    std::mt19937 rng(23);
    const int64_t N = 8, D = 4, M = 8, k = 2;

    const sae_matrix row = random_matrix(1, D, 1.0f, rng);
    sae_matrix x(N, D);
    for (int64_t n = 0; n < N; ++n) {
        std::copy(row.data.begin(), row.data.end(), x.data.begin() + n * D);
    }
    const sae_matrix w = random_matrix(M, D, 1.0f, rng);
    const std::vector<float> b(M, 1.0f);

    sae_matrix gv(N, k);
    for (float & v : gv.data) v = 1.0f;

    sae_encoder_params params;
    params.k = k;
    sae_host_options opt;
    opt.n_threads = 4;

    auto call = sae_encode(x, w, &b, params, opt);
    const sae_backward_result got = call->backward(gv, sae_grad_request{});

    for (int64_t j = 0; j < k; ++j) {
        const int32_t m = call->output().index(0, j);
        if ((*got.grad_bias)[m] != (float) N) {
            std::cerr << "collisions: grad_bias[" << m << "] = " << (*got.grad_bias)[m] << ", want " << N << "\n";
            return false;
        }
        for (int64_t d = 0; d < D; ++d) {
            const double want = (double) N * row.data[d];
            if (std::fabs(got.grad_weight->at(m, d) - want) > 1e-4 * std::max(1.0, std::fabs(want))) {
                std::cerr << "collisions: grad_weight[" << m << ", " << d << "] = " << got.grad_weight->at(m, d)
                          << ", want " << want << "\n";
                return false;
            }
        }
    }

    for (int64_t m = 0; m < M; ++m) {
        const bool picked = m == call->output().index(0, 0) || m == call->output().index(0, 1);
        if (!picked && (*got.grad_bias)[m] != 0.0f) {
            std::cerr << "collisions: unselected latent " << m << " got a gradient\n";
            return false;
        }
    }
    return true;
}

bool test_request_flags() {
    std::mt19937 rng(29);
    const int64_t N = 6, D = 5, M = 10, k = 2;
    const sae_matrix x = random_matrix(N, D, 1.0f, rng);
    const sae_matrix w = random_matrix(M, D, 1.0f, rng);
    const std::vector<float> b(M, 0.0f);
    const sae_matrix gv = random_matrix(N, k, 1.0f, rng);

    sae_encoder_params params;
    params.k = k;
    auto call = sae_encode(x, w, &b, params);

    sae_grad_request only_weight;
    only_weight.input = false;
    only_weight.bias  = false;
    const sae_backward_result r1 = call->backward(gv, only_weight);
    if (r1.grad_input || !r1.grad_weight || r1.grad_bias) {
        std::cerr << "request flags: weight-only request returned the wrong set of gradients\n";
        return false;
    }

    sae_grad_request none;
    none.input = none.weight = none.bias = false;
    const sae_backward_result r2 = call->backward(gv, none);
    if (r2.grad_input || r2.grad_weight || r2.grad_bias) {
        std::cerr << "request flags: empty request returned gradients\n";
        return false;
    }

    // the same call can be differentiated again with another upstream gradient
    const sae_matrix gv2 = random_matrix(N, k, 1.0f, rng);
    const sae_backward_result r3 = call->backward(gv2, sae_grad_request{});
    const sae_backward_result ref = sae_reference_backward(x, w, true, call->output(), gv2);
    if (sae_max_abs_diff(*r3.grad_input, *ref.grad_input) > 1e-4) {
        std::cerr << "request flags: second backward call differs from the reference\n";
        return false;
    }

    try {
        call->backward(random_matrix(N, k + 1, 1.0f, rng), sae_grad_request{});
        std::cerr << "request flags: mis-shaped grad_values accepted\n";
        return false;
    } catch (const sae_dimension_error &) {
    }
    return true;
}

bool test_thread_counts() {
    std::mt19937 rng(31);
    const int64_t N = 33, D = 16, M = 64, k = 8;
    const sae_matrix x = random_matrix(N, D, 1.0f, rng);
    const sae_matrix w = random_matrix(M, D, 0.25f, rng);
    const std::vector<float> b(M, 0.02f);
    const sae_matrix gv = random_matrix(N, k, 1.0f, rng);

    sae_encoder_params params;
    params.k = k;

    std::vector<sae_backward_result> results;
    std::vector<std::vector<int32_t>> indices;
    for (int n_threads : { 1, 4, 7 }) {
        sae_host_options opt;
        opt.n_threads = n_threads;
        auto call = sae_encode(x, w, &b, params, opt);
        indices.push_back(call->output().top_indices);
        results.push_back(call->backward(gv, sae_grad_request{}));
    }

    for (size_t i = 1; i < results.size(); ++i) {
        if (indices[i] != indices[0]) {
            std::cerr << "thread counts: selected indices differ\n";
            return false;
        }
        if (results[i].grad_input->data  != results[0].grad_input->data ||
            results[i].grad_weight->data != results[0].grad_weight->data ||
            *results[i].grad_bias        != *results[0].grad_bias) {
            std::cerr << "thread counts: gradients differ between thread counts\n";
            return false;
        }
    }
    return true;
}

} // namespace

int main() {
    bool ok = true;
    ok = test_against_reference() && ok;
    ok = test_collisions()        && ok;
    ok = test_request_flags()     && ok;
    ok = test_thread_counts()     && ok;
    std::fputs(ok ? "test-sae-backward: ok\n" : "test-sae-backward: failed\n", stdout);
    return ok ? 0 : 1;
}
