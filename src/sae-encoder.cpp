#include "sae-encoder.h"

#include "sae-backward.h"
#include "sae-quant.h"
#include "sae-select.h"

#include "ggml.h"

#include <cinttypes>
#include <cstdio>
#include <limits>
#include <string>

// relu6 ceiling of the quantized path
static constexpr float SAE_RECTIFY_MAX = 6.0f;

static std::string sae_shape_str(const ggml_tensor * t) {
    char buf[96];
    std::snprintf(buf, sizeof(buf), "[%" PRId64 ", %" PRId64 ", %" PRId64 ", %" PRId64 "]",
            t->ne[0], t->ne[1], t->ne[2], t->ne[3]);
    return buf;
}

sae_activation sae_activation_from_string(const std::string & s) {
    if (s == "topk")     return sae_activation::topk;
    if (s == "groupmax") return sae_activation::groupmax;
    throw std::invalid_argument("unknown activation: \"" + s + "\" (expected topk or groupmax)");
}

const char * sae_activation_name(sae_activation a) {
    switch (a) {
        case sae_activation::topk:     return "topk";
        case sae_activation::groupmax: return "groupmax";
    }
    return "topk";
}

void sae_validate_params(const sae_encoder_params & params, int64_t n_latents) {
    const int64_t k = params.k;
    if (k <= 0 || k > n_latents) {
        throw std::invalid_argument("k must be in [1, " + std::to_string(n_latents) + "], got " + std::to_string(k));
    }
    if (params.activation == sae_activation::groupmax && n_latents % k != 0) {
        throw std::invalid_argument("groupmax needs k to divide the number of latents (M=" +
                std::to_string(n_latents) + ", k=" + std::to_string(k) + ")");
    }
    if (params.quantization) {
        if (params.quant.levels < 2) {
            throw std::invalid_argument("quantization levels must be >= 2, got " + std::to_string(params.quant.levels));
        }
        if (!(params.quant.max_val > params.quant.min_val)) {
            throw std::invalid_argument("quantization max_val must exceed min_val (min_val=" +
                    std::to_string(params.quant.min_val) + ", max_val=" + std::to_string(params.quant.max_val) + ")");
        }
    }
}

static void sae_check_matrix(const ggml_tensor * t, const char * name) {
    if (!t) {
        throw sae_dimension_error(std::string(name) + " is null");
    }
    if (t->ne[2] != 1 || t->ne[3] != 1) {
        throw sae_dimension_error(std::string(name) + " must be 2-D, got " + sae_shape_str(t));
    }
}

static void sae_check_tensors(const ggml_tensor * input, const ggml_tensor * weight, const ggml_tensor * bias) {
    sae_check_matrix(input, "input");
    sae_check_matrix(weight, "weight");

    if (input->type != GGML_TYPE_F32) {
        throw sae_dimension_error(std::string("input must be F32, got ") + ggml_type_name(input->type));
    }
    if (weight->type != GGML_TYPE_F32 && weight->type != GGML_TYPE_F16) {
        throw sae_dimension_error(std::string("weight must be F32 or F16, got ") + ggml_type_name(weight->type));
    }
    if (weight->ne[0] != input->ne[0]) {
        throw sae_dimension_error("weight " + sae_shape_str(weight) + " and input " + sae_shape_str(input) +
                " disagree on the number of input features");
    }
    if (weight->ne[1] > std::numeric_limits<int32_t>::max()) {
        throw sae_dimension_error("too many latents for I32 indices: " + std::to_string(weight->ne[1]));
    }
    if (bias) {
        if (bias->type != GGML_TYPE_F32) {
            throw sae_dimension_error(std::string("bias must be F32, got ") + ggml_type_name(bias->type));
        }
        if (ggml_nelements(bias) != weight->ne[1] || bias->ne[0] != weight->ne[1]) {
            throw sae_dimension_error("bias " + sae_shape_str(bias) + " does not match " +
                    std::to_string(weight->ne[1]) + " latents");
        }
    }
}

sae_encoder_output sae_fused_encoder(
        ggml_context     * ctx,
        ggml_tensor      * input,
        ggml_tensor      * weight,
        ggml_tensor      * bias,
        sae_encoder_call & call) {
    sae_check_tensors(input, weight, bias);
    sae_validate_params(call.params, weight->ne[1]);

    call.input     = input;
    call.weight    = weight;
    call.bias      = bias;
    call.n_samples = input->ne[1];
    call.n_in      = input->ne[0];
    call.n_latents = weight->ne[1];

    // z = x W^T + b : [M, N]
    ggml_tensor * z = ggml_mul_mat(ctx, weight, input);
    if (bias) {
        z = ggml_add(ctx, z, bias);
    }

    ggml_tensor * pre = nullptr;
    if (call.params.quantization) {
        call.noise_seed = call.params.seed ? *call.params.seed : sae_quant_fresh_seed();
        pre = sae_quantize(ctx, ggml_clamp(ctx, z, 0.0f, SAE_RECTIFY_MAX), call);
    } else {
        pre = ggml_relu(ctx, z);
    }

    ggml_tensor * idx = sae_select_indices(ctx, pre, call);
    ggml_tensor * val = sae_gather_values(ctx, pre, idx);

    ggml_set_name(pre, "sae.pre_acts");
    ggml_set_name(idx, "sae.top_indices");
    ggml_set_name(val, "sae.top_acts");

    call.indices = idx;

    sae_encoder_output out;
    out.top_acts    = val;
    out.top_indices = idx;
    out.pre_acts    = pre;
    return out;
}

sae_encoder_grads sae_fused_encoder_backward(
        ggml_context           * ctx,
        const sae_encoder_call & call,
        ggml_tensor            * grad_values,
        const sae_grad_request & request) {
    if (!call.indices) {
        throw std::invalid_argument("backward requested for an encoder call that has no forward graph");
    }
    sae_check_matrix(grad_values, "grad_values");
    if (grad_values->type != GGML_TYPE_F32) {
        throw sae_dimension_error(std::string("grad_values must be F32, got ") + ggml_type_name(grad_values->type));
    }
    if (grad_values->ne[0] != call.params.k || grad_values->ne[1] != call.n_samples) {
        throw sae_dimension_error("grad_values " + sae_shape_str(grad_values) + " does not match top_acts " +
                sae_shape_str(call.indices));
    }

    ggml_tensor * gval = ggml_is_contiguous(grad_values) ? grad_values : ggml_cont(ctx, grad_values);

    sae_encoder_grads grads;
    if (request.input) {
        grads.input = sae_grad_input(ctx, call.weight, call.indices, gval);
        ggml_set_name(grads.input, "sae.grad_input");
    }
    if (request.weight) {
        grads.weight = sae_grad_weight(ctx, call.input, call.indices, gval, call.n_latents);
        ggml_set_name(grads.weight, "sae.grad_weight");
    }
    if (request.bias && call.bias) {
        grads.bias = sae_grad_bias(ctx, call.indices, gval, call.n_latents);
        ggml_set_name(grads.bias, "sae.grad_bias");
    }
    return grads;
}
