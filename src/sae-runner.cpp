#include "sae-runner.h"

#include "ggml.h"
#include "ggml-cpu.h"

#include <algorithm>
#include <cinttypes>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <string>

static const bool sae_runner_debug = std::getenv("SAE_ENCODER_DEBUG") != nullptr;

namespace {

struct ggml_context_deleter {
    void operator()(ggml_context * ctx) const { ggml_free(ctx); }
};

using ggml_context_ptr = std::unique_ptr<ggml_context, ggml_context_deleter>;

ggml_context * init_context(size_t n_bytes) {
    const size_t mem_size =
            ggml_tensor_overhead() * 32 +
            ggml_graph_overhead() +
            n_bytes +
            1024*1024;

    ggml_init_params params = { mem_size, nullptr, false };
    ggml_context * ctx = ggml_init(params);
    if (!ctx) {
        throw std::runtime_error("failed to init ggml context (" + std::to_string(mem_size) + " bytes)");
    }
    return ctx;
}

void check_host_matrix(const sae_matrix & m, const char * name) {
    if (m.rows <= 0 || m.cols <= 0 || (int64_t) m.data.size() != m.rows * m.cols) {
        throw sae_dimension_error(std::string(name) + ": " + std::to_string(m.rows) + "x" + std::to_string(m.cols) +
                " matrix with " + std::to_string(m.data.size()) + " values");
    }
}

} // namespace

sae_graph_runner::sae_graph_runner(int n_threads) : n_threads_(std::max(1, n_threads)) {
    ggml_threadpool_params tpp = ggml_threadpool_params_default(n_threads_);
    threadpool_ = ggml_threadpool_new(&tpp);
    if (!threadpool_) {
        throw std::runtime_error("failed to create ggml threadpool with " + std::to_string(n_threads_) + " threads");
    }
}

sae_graph_runner::~sae_graph_runner() {
    if (threadpool_) ggml_threadpool_free(threadpool_);
}

void sae_graph_runner::compute(ggml_cgraph * gf) {
    ggml_cplan plan = ggml_graph_plan(gf, n_threads_, threadpool_);
    if (plan.work_size > 0) {
        work_.resize(plan.work_size);
        plan.work_data = work_.data();
    }

    const ggml_status st = ggml_graph_compute(gf, &plan);
    if (st != GGML_STATUS_SUCCESS) {
        throw std::runtime_error(std::string("ggml_graph_compute failed: ") + ggml_status_to_string(st));
    }
}

sae_host_call::sae_host_call(const sae_encoder_params & params, std::shared_ptr<sae_graph_runner> runner)
    : call_(new sae_encoder_call(params)),
      runner_(std::move(runner)) {}

sae_host_call::~sae_host_call() {
    if (ctx_) ggml_free(ctx_);
}

std::unique_ptr<sae_host_call> sae_encode(
        const sae_matrix         & input,
        const sae_matrix         & weight,
        const std::vector<float> * bias,
        const sae_encoder_params & params,
        const sae_host_options   & options) {
    check_host_matrix(input, "input");
    check_host_matrix(weight, "weight");
    if (weight.cols != input.cols) {
        throw sae_dimension_error("weight has " + std::to_string(weight.cols) + " columns, input has " +
                std::to_string(input.cols));
    }
    if (bias && (int64_t) bias->size() != weight.rows) {
        throw sae_dimension_error("bias has " + std::to_string(bias->size()) + " values, weight has " +
                std::to_string(weight.rows) + " rows");
    }
    sae_validate_params(params, weight.rows);

    const int64_t N = input.rows;
    const int64_t D = input.cols;
    const int64_t M = weight.rows;
    const int64_t k = params.k;

    std::shared_ptr<sae_graph_runner> runner = options.runner;
    if (!runner) {
        runner = std::make_shared<sae_graph_runner>(options.n_threads);
    }

    std::unique_ptr<sae_host_call> hc(new sae_host_call(params, runner));

    // input, weight, bias, z, rectified, pre_acts, indices, values, saved indices
    const size_t n_bytes = sizeof(float) * (size_t) (N * D + M * D + M + 3 * M * N + 3 * N * k);
    hc->ctx_ = init_context(n_bytes);
    ggml_context * ctx = hc->ctx_;

    ggml_tensor * x = ggml_new_tensor_2d(ctx, GGML_TYPE_F32, D, N);
    std::memcpy(x->data, input.data.data(), (size_t) (N * D) * sizeof(float));
    ggml_set_name(x, "sae.input");

    ggml_tensor * w = ggml_new_tensor_2d(ctx, options.weight_f16 ? GGML_TYPE_F16 : GGML_TYPE_F32, D, M);
    if (options.weight_f16) {
        ggml_fp32_to_fp16_row(weight.data.data(), (ggml_fp16_t *) w->data, M * D);
    } else {
        std::memcpy(w->data, weight.data.data(), (size_t) (M * D) * sizeof(float));
    }
    ggml_set_name(w, "sae.weight");

    ggml_tensor * b = nullptr;
    if (bias) {
        b = ggml_new_tensor_1d(ctx, GGML_TYPE_F32, M);
        std::memcpy(b->data, bias->data(), (size_t) M * sizeof(float));
        ggml_set_name(b, "sae.bias");
    }

    const sae_encoder_output out = sae_fused_encoder(ctx, x, w, b, *hc->call_);

    ggml_cgraph * gf = ggml_new_graph(ctx);
    ggml_build_forward_expand(gf, out.pre_acts);
    ggml_build_forward_expand(gf, out.top_indices);
    ggml_build_forward_expand(gf, out.top_acts);

    const int64_t t0 = ggml_time_us();
    runner->compute(gf);
    const int64_t t1 = ggml_time_us();

    sae_forward_result & res = hc->result_;
    res.k = k;
    res.top_acts = sae_matrix(N, k);
    std::memcpy(res.top_acts.data.data(), out.top_acts->data, (size_t) (N * k) * sizeof(float));
    res.top_indices.resize((size_t) (N * k));
    std::memcpy(res.top_indices.data(), out.top_indices->data, (size_t) (N * k) * sizeof(int32_t));
    res.pre_acts = sae_matrix(N, M);
    std::memcpy(res.pre_acts.data.data(), out.pre_acts->data, (size_t) (N * M) * sizeof(float));

    // backward graphs must see the indices as a leaf, or they would recompute the forward
    ggml_tensor * saved = ggml_dup_tensor(ctx, out.top_indices);
    std::memcpy(saved->data, out.top_indices->data, ggml_nbytes(saved));
    ggml_set_name(saved, "sae.saved_indices");
    hc->call_->indices = saved;

    if (sae_runner_debug) {
        std::fprintf(stderr, "sae-runner: forward N=%" PRId64 " D=%" PRId64 " M=%" PRId64 " k=%" PRId64 " %s%s (%d thr) %.3f ms\n",
                N, D, M, k, sae_activation_name(params.activation), params.quantization ? "+quant" : "",
                runner->n_threads(), (t1 - t0) / 1000.0);
    }

    return hc;
}

sae_backward_result sae_host_call::backward(const sae_matrix & grad_values, const sae_grad_request & request) {
    const sae_encoder_call & call = *call_;

    const int64_t N = call.n_samples;
    const int64_t D = call.n_in;
    const int64_t M = call.n_latents;
    const int64_t k = call.params.k;

    if (grad_values.rows != N || grad_values.cols != k || (int64_t) grad_values.data.size() != N * k) {
        throw sae_dimension_error("grad_values is " + std::to_string(grad_values.rows) + "x" +
                std::to_string(grad_values.cols) + ", top_acts is " + std::to_string(N) + "x" + std::to_string(k));
    }

    sae_backward_result res;

    const size_t n_bytes = sizeof(float) * (size_t) (N * k + N * D + M * D + M);
    ggml_context_ptr ctx(init_context(n_bytes));

    ggml_tensor * gv = ggml_new_tensor_2d(ctx.get(), GGML_TYPE_F32, k, N);
    std::memcpy(gv->data, grad_values.data.data(), (size_t) (N * k) * sizeof(float));
    ggml_set_name(gv, "sae.grad_values");

    const sae_encoder_grads grads = sae_fused_encoder_backward(ctx.get(), call, gv, request);
    if (!grads.input && !grads.weight && !grads.bias) {
        return res;
    }

    ggml_cgraph * gf = ggml_new_graph(ctx.get());
    if (grads.input)  ggml_build_forward_expand(gf, grads.input);
    if (grads.weight) ggml_build_forward_expand(gf, grads.weight);
    if (grads.bias)   ggml_build_forward_expand(gf, grads.bias);

    const int64_t t0 = ggml_time_us();
    runner_->compute(gf);
    const int64_t t1 = ggml_time_us();

    if (grads.input) {
        sae_matrix g(N, D);
        std::memcpy(g.data.data(), grads.input->data, (size_t) (N * D) * sizeof(float));
        res.grad_input = std::move(g);
    }
    if (grads.weight) {
        sae_matrix g(M, D);
        std::memcpy(g.data.data(), grads.weight->data, (size_t) (M * D) * sizeof(float));
        res.grad_weight = std::move(g);
    }
    if (grads.bias) {
        std::vector<float> g((size_t) M);
        std::memcpy(g.data(), grads.bias->data, (size_t) M * sizeof(float));
        res.grad_bias = std::move(g);
    }

    if (sae_runner_debug) {
        std::fprintf(stderr, "sae-runner: backward input=%d weight=%d bias=%d %.3f ms\n",
                grads.input != nullptr, grads.weight != nullptr, grads.bias != nullptr, (t1 - t0) / 1000.0);
    }

    return res;
}
