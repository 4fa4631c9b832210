#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

struct ggml_context;
struct ggml_tensor;

// Fused sparse-autoencoder encoder: linear -> rectify [-> stochastic quantize] -> top-k/groupmax,
// with a backward pass that only touches the k selected latents per row.
//
// Layout (ggml, ne0 fastest):
//   input       : [D, N]  F32
//   weight      : [D, M]  F32/F16
//   bias        : [M]     F32 (optional)
//   pre_acts    : [M, N]  F32
//   top_acts    : [k, N]  F32
//   top_indices : [k, N]  I32, global latent ids in [0, M)

enum class sae_activation {
    topk,     // k largest per row
    groupmax, // max of each of k contiguous groups of M/k latents
};

// Throws std::invalid_argument naming the value for anything but "topk" / "groupmax".
sae_activation sae_activation_from_string(const std::string & s);
const char *   sae_activation_name(sae_activation a);

// Shape or type of a tensor does not match the encoder contract.
class sae_dimension_error : public std::invalid_argument {
public:
    explicit sae_dimension_error(const std::string & what) : std::invalid_argument(what) {}
};

struct sae_quant_params {
    float   min_val = 0.0f;
    float   max_val = 6.0f;
    int32_t levels  = 16;
};

struct sae_encoder_params {
    int64_t        k          = 32;
    sae_activation activation = sae_activation::topk;

    bool             quantization = false;
    sae_quant_params quant;

    // Noise seed for the quantization stage. Unset => a fresh seed is drawn on every forward call.
    std::optional<uint64_t> seed;
};

// Checks k / activation / quantization parameters against the number of latents.
// Throws std::invalid_argument.
void sae_validate_params(const sae_encoder_params & params, int64_t n_latents);

// Which gradients the backward call should produce.
struct sae_grad_request {
    bool input  = true;
    bool weight = true;
    bool bias   = true;
};

// State saved by one forward call for its paired backward call. One instance per call;
// the custom ops of both graphs read their configuration from it, so it must outlive
// the computation of those graphs.
struct sae_encoder_call {
    sae_encoder_params params;
    uint64_t           noise_seed = 0; // resolved per call

    ggml_tensor * input   = nullptr;
    ggml_tensor * weight  = nullptr;
    ggml_tensor * bias    = nullptr;
    ggml_tensor * indices = nullptr;

    int64_t n_samples = 0;
    int64_t n_in      = 0;
    int64_t n_latents = 0;

    explicit sae_encoder_call(const sae_encoder_params & p) : params(p) {}

    // graph nodes keep a pointer to this object
    sae_encoder_call(const sae_encoder_call &) = delete;
    sae_encoder_call & operator=(const sae_encoder_call &) = delete;
};

struct sae_encoder_output {
    ggml_tensor * top_acts    = nullptr;
    ggml_tensor * top_indices = nullptr;
    ggml_tensor * pre_acts    = nullptr;
};

// nullptr marks a gradient that was not requested (or has no input, e.g. grad_bias without bias).
struct sae_encoder_grads {
    ggml_tensor * input  = nullptr;
    ggml_tensor * weight = nullptr;
    ggml_tensor * bias   = nullptr;
};

// Build the forward graph nodes. Picks the plain or the quantized path from
// call.params.quantization and records the saved state in `call`.
// Throws std::invalid_argument / sae_dimension_error before creating any node.
sae_encoder_output sae_fused_encoder(
        ggml_context     * ctx,
        ggml_tensor      * input,
        ggml_tensor      * weight,
        ggml_tensor      * bias,
        sae_encoder_call & call);

// Build the sparse backward nodes for a call previously passed to sae_fused_encoder.
// grad_values: [k, N] F32 upstream gradient of top_acts.
sae_encoder_grads sae_fused_encoder_backward(
        ggml_context           * ctx,
        const sae_encoder_call & call,
        ggml_tensor            * grad_values,
        const sae_grad_request & request);
