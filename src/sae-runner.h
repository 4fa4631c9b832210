#pragma once

#include "sae-encoder.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

struct ggml_cgraph;
struct ggml_threadpool;

// Row-major host matrix.
struct sae_matrix {
    int64_t rows = 0;
    int64_t cols = 0;
    std::vector<float> data;

    sae_matrix() = default;
    sae_matrix(int64_t r, int64_t c) : rows(r), cols(c), data((size_t) (r * c), 0.0f) {}

    float & at(int64_t r, int64_t c)       { return data[(size_t) (r * cols + c)]; }
    float   at(int64_t r, int64_t c) const { return data[(size_t) (r * cols + c)]; }
};

struct sae_forward_result {
    sae_matrix           top_acts;    // N x k
    std::vector<int32_t> top_indices; // N x k, row-major
    sae_matrix           pre_acts;    // N x M
    int64_t              k = 0;

    int32_t index(int64_t n, int64_t j) const { return top_indices[(size_t) (n * k + j)]; }
};

// std::nullopt marks a gradient that was not requested.
struct sae_backward_result {
    std::optional<sae_matrix>         grad_input;  // N x D
    std::optional<sae_matrix>         grad_weight; // M x D
    std::optional<std::vector<float>> grad_bias;   // M
};

// Computes ggml graphs on a private CPU threadpool. Not safe to use from two threads at once.
class sae_graph_runner {
public:
    explicit sae_graph_runner(int n_threads);
    ~sae_graph_runner();

    sae_graph_runner(const sae_graph_runner &) = delete;
    sae_graph_runner & operator=(const sae_graph_runner &) = delete;

    // Throws std::runtime_error if ggml reports a failure.
    void compute(ggml_cgraph * gf);

    int n_threads() const { return n_threads_; }

private:
    int n_threads_ = 1;
    ggml_threadpool * threadpool_ = nullptr;
    std::vector<uint8_t> work_;
};

struct sae_host_options {
    int  n_threads  = 1;
    bool weight_f16 = false; // store the weight as F16 inside the graph

    // reuse a threadpool across calls; a private one with n_threads is created when empty
    std::shared_ptr<sae_graph_runner> runner;
};

class sae_host_call;

// Dispatcher over host matrices: input N x D, weight M x D, optional bias of length M.
// Throws std::invalid_argument / sae_dimension_error on bad arguments.
std::unique_ptr<sae_host_call> sae_encode(
        const sae_matrix         & input,
        const sae_matrix         & weight,
        const std::vector<float> * bias,
        const sae_encoder_params & params,
        const sae_host_options   & options = {});

// One host-side encoder call: owns the ggml context that holds the saved input/weight/bias,
// the selected indices and the forward results. backward() is its paired gradient call and
// may be invoked any number of times with different upstream gradients.
class sae_host_call {
public:
    ~sae_host_call();

    sae_host_call(const sae_host_call &) = delete;
    sae_host_call & operator=(const sae_host_call &) = delete;

    const sae_forward_result & output() const { return result_; }
    const sae_encoder_call   & call()   const { return *call_; }

    // grad_values: N x k upstream gradient of top_acts.
    sae_backward_result backward(const sae_matrix & grad_values, const sae_grad_request & request);

private:
    friend std::unique_ptr<sae_host_call> sae_encode(
            const sae_matrix &, const sae_matrix &, const std::vector<float> *,
            const sae_encoder_params &, const sae_host_options &);

    sae_host_call(const sae_encoder_params & params, std::shared_ptr<sae_graph_runner> runner);

    ggml_context * ctx_ = nullptr;
    std::unique_ptr<sae_encoder_call> call_;
    std::shared_ptr<sae_graph_runner> runner_;
    sae_forward_result result_;
};
