#include "include/sae_model.h"
#include "include/sae_report.h"
#include "include/sae_runner.h"

#include "ggml.h"
#include "sae-reference.h"
#include "sae-runner.h"
#include "sae-stats.h"

#include <algorithm>
#include <cinttypes>
#include <cmath>
#include <cstdio>
#include <exception>
#include <memory>
#include <random>

namespace {

// Weight as the F16 graph sees it.
sae_matrix round_to_f16(const sae_matrix & w) {
    sae_matrix out = w;
    for (float & v : out.data) {
        v = ggml_fp16_to_fp32(ggml_fp32_to_fp16(v));
    }
    return out;
}

double mean_quant_err(const sae_model & model, const sae_matrix & weight, const sae_matrix & input,
        const sae_forward_result & fwd) {
    const sae_matrix z = sae_reference_linear(input, weight, model.has_bias ? &model.bias : nullptr);
    const sae_matrix r = sae_reference_rectify(z, true);
    double acc = 0.0;
    for (size_t i = 0; i < r.data.size(); ++i) {
        acc += (double) fwd.pre_acts.data[i] - (double) r.data[i];
    }
    return r.data.empty() ? 0.0 : acc / (double) r.data.size();
}

double max_abs(const std::vector<float> & v) {
    double m = 0.0;
    for (float x : v) m = std::max(m, (double) std::fabs(x));
    return m;
}

sae_grad_check check_grads(const sae_backward_result & got, const sae_backward_result & ref) {
    sae_grad_check gc;
    const double scale = std::max({1.0, max_abs(ref.grad_input->data), max_abs(ref.grad_weight->data)});
    gc.tol = 1e-3 * scale;
    gc.diff_input  = sae_max_abs_diff(*got.grad_input,  *ref.grad_input);
    gc.diff_weight = sae_max_abs_diff(*got.grad_weight, *ref.grad_weight);
    gc.passed = gc.diff_input <= gc.tol && gc.diff_weight <= gc.tol;
    if (ref.grad_bias.has_value()) {
        gc.diff_bias = got.grad_bias.has_value() ? sae_max_abs_diff(*got.grad_bias, *ref.grad_bias) : INFINITY;
        gc.passed = gc.passed && *gc.diff_bias <= gc.tol;
    }
    return gc;
}

int run(const sae_args & args) {
    const sae_encoder_params params = sae_args_to_params(args);

    std::mt19937 rng(args.seed);

    sae_model model;
    if (!args.model_fname.empty()) {
        std::string error;
        if (!sae_model_load_gguf(args.model_fname, args.weight_name, args.use_bias ? args.bias_name : "", model, error)) {
            fprintf(stderr, "sae-encode: %s\n", error.c_str());
            return 1;
        }
        fprintf(stderr, "sae-encode: loaded %s: %" PRId64 " latents x %" PRId64 " inputs%s\n",
                model.source.c_str(), model.n_latents(), model.n_in(), model.has_bias ? " (+bias)" : "");
    } else {
        model = sae_model_random(args.n_in, args.n_latents, args.use_bias, rng);
    }

    sae_validate_params(params, model.n_latents());

    const sae_matrix input = sae_random_inputs(args.n_samples, model.n_in(), rng);
    const std::vector<float> * bias = model.has_bias ? &model.bias : nullptr;

    sae_host_options options;
    options.n_threads  = args.n_threads;
    options.weight_f16 = args.weight_f16;
    options.runner     = std::make_shared<sae_graph_runner>(args.n_threads);

    sae_run_report report;
    report.source     = model.source;
    report.n_samples  = input.rows;
    report.n_in       = model.n_in();
    report.n_latents  = model.n_latents();
    report.has_bias   = model.has_bias;
    report.weight_f16 = args.weight_f16;
    report.n_threads  = args.n_threads;
    report.repeat     = args.repeat;
    report.params     = params;

    std::unique_ptr<sae_host_call> call;
    int64_t t_fwd_us = 0;
    for (int r = 0; r < args.repeat; ++r) {
        const int64_t t0 = ggml_time_us();
        call = sae_encode(input, model.weight, bias, params, options);
        t_fwd_us += ggml_time_us() - t0;
        sae_latent_stats_add(report.stats, call->output());
    }
    report.forward_ms = (double) t_fwd_us / 1000.0 / (double) args.repeat;
    report.noise_seed = call->call().noise_seed;

    const sae_matrix graph_weight = args.weight_f16 ? round_to_f16(model.weight) : model.weight;
    const sae_forward_result & fwd = call->output();

    if (params.quantization) {
        report.quant_mean_err = mean_quant_err(model, graph_weight, input, fwd);
    }

    if (args.backward) {
        const sae_matrix grad_values = sae_random_grads(input.rows, params.k, rng);
        sae_grad_request request;
        request.bias = model.has_bias;

        const int64_t t0 = ggml_time_us();
        const sae_backward_result grads = call->backward(grad_values, request);
        report.backward_ms = (double) (ggml_time_us() - t0) / 1000.0;

        if (args.check_grad) {
            const sae_backward_result ref = sae_reference_backward(input, graph_weight, model.has_bias, fwd, grad_values);
            report.grad_check = check_grads(grads, ref);
        }
    }

    printf("sae-encode: %s N=%" PRId64 " D=%" PRId64 " M=%" PRId64 " k=%" PRId64 " activation=%s%s\n",
            report.source.c_str(), report.n_samples, report.n_in, report.n_latents, params.k,
            sae_activation_name(params.activation), params.quantization ? " quant" : "");
    printf("  forward   %.3f ms (mean of %d, %d threads)\n", report.forward_ms, args.repeat, args.n_threads);
    if (report.backward_ms >= 0.0) {
        printf("  backward  %.3f ms\n", report.backward_ms);
    }
    printf("  dead latents %" PRId64 "/%" PRId64 ", nonzero pre-acts %.4f, mean top act %.4f, max %.4f\n",
            report.stats.n_dead(), report.stats.n_latents, report.stats.frac_nonzero_pre(),
            report.stats.mean_top_act(), report.stats.max_top_act);
    if (report.quant_mean_err.has_value()) {
        printf("  quant seed %" PRIu64 ", mean error %.6f\n", report.noise_seed, *report.quant_mean_err);
    }

    int rc = 0;
    if (report.grad_check.has_value()) {
        const sae_grad_check & gc = *report.grad_check;
        printf("  grad check: input %.3e weight %.3e", gc.diff_input, gc.diff_weight);
        if (gc.diff_bias.has_value()) {
            printf(" bias %.3e", *gc.diff_bias);
        }
        printf(" (tol %.3e) %s\n", gc.tol, gc.passed ? "ok" : "FAILED");
        if (!gc.passed) {
            rc = 1;
        }
    }

    if (!args.report_json.empty()) {
        const sae_report_result res = sae_write_report_json(args.report_json, report);
        if (!res.ok) {
            fprintf(stderr, "sae-encode: %s\n", res.error.c_str());
            return 1;
        }
        fprintf(stderr, "sae-encode: wrote %s\n", args.report_json.c_str());
    }

    return rc;
}

} // namespace

int sae_run(const sae_args & args) {
    try {
        return run(args);
    } catch (const std::exception & e) {
        fprintf(stderr, "sae-encode: %s\n", e.what());
        return 1;
    }
}
