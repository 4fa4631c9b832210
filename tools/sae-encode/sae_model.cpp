#include "include/sae_model.h"

#include "ggml.h"
#include "gguf.h"

#include <cmath>
#include <cstring>

namespace {

void read_row_f32(const ggml_tensor * t, int64_t j, float * out) {
    const int64_t n = t->ne[0];
    const uint8_t * base = (const uint8_t *) t->data + j * t->nb[1];

    if (t->type == GGML_TYPE_F32) {
        std::memcpy(out, base, n * sizeof(float));
        return;
    }
    if (t->type == GGML_TYPE_F16) {
        const ggml_fp16_t * v = (const ggml_fp16_t *) base;
        for (int64_t i = 0; i < n; ++i) out[i] = ggml_fp16_to_fp32(v[i]);
        return;
    }

    const auto * traits = ggml_get_type_traits(t->type);
    GGML_ASSERT(traits->to_float && "no to_float for tensor type");
    traits->to_float(base, out, n);
}

} // namespace

bool sae_model_load_gguf(
        const std::string & fname,
        const std::string & weight_name,
        const std::string & bias_name,
        sae_model         & out,
        std::string       & error) {
    ggml_context * ctx_data = nullptr;
    gguf_init_params params = { false, &ctx_data };
    gguf_context * src = gguf_init_from_file(fname.c_str(), params);
    if (!src || !ctx_data) {
        error = "failed to load " + fname;
        if (src) gguf_free(src);
        return false;
    }

    auto fail = [&](const std::string & msg) {
        error = msg;
        ggml_free(ctx_data);
        gguf_free(src);
        return false;
    };

    const ggml_tensor * W = ggml_get_tensor(ctx_data, weight_name.c_str());
    if (!W) {
        return fail("tensor " + weight_name + " not found in " + fname);
    }
    if (ggml_n_dims(W) != 2) {
        return fail("tensor " + weight_name + " must be 2-D, got " + std::to_string(ggml_n_dims(W)) + "-D");
    }
    if (!ggml_get_type_traits(W->type)->to_float && W->type != GGML_TYPE_F32) {
        return fail(std::string("unsupported weight type ") + ggml_type_name(W->type));
    }

    const int64_t D = W->ne[0];
    const int64_t M = W->ne[1];

    sae_model model;
    model.source = fname;
    model.weight = sae_matrix(M, D);
    for (int64_t m = 0; m < M; ++m) {
        read_row_f32(W, m, model.weight.data.data() + m * D);
    }

    const ggml_tensor * b = bias_name.empty() ? nullptr : ggml_get_tensor(ctx_data, bias_name.c_str());
    if (b) {
        if (ggml_n_dims(b) != 1 || b->ne[0] != M) {
            return fail("tensor " + bias_name + " must have shape [" + std::to_string(M) + "]");
        }
        if (!ggml_get_type_traits(b->type)->to_float && b->type != GGML_TYPE_F32) {
            return fail(std::string("unsupported bias type ") + ggml_type_name(b->type));
        }
        model.bias.resize((size_t) M);
        read_row_f32(b, 0, model.bias.data());
        model.has_bias = true;
    }

    ggml_free(ctx_data);
    gguf_free(src);

    out = std::move(model);
    return true;
}

sae_model sae_model_random(int64_t n_in, int64_t n_latents, bool use_bias, std::mt19937 & rng) {
    sae_model model;
    model.source = "random";
    model.weight = sae_matrix(n_latents, n_in);

    std::normal_distribution<float> nd(0.0f, 1.0f / std::sqrt((float) n_in));
    for (float & v : model.weight.data) v = nd(rng);

    if (use_bias) {
        std::normal_distribution<float> nb(0.0f, 0.02f);
        model.bias.resize((size_t) n_latents);
        for (float & v : model.bias) v = nb(rng);
        model.has_bias = true;
    }
    return model;
}

sae_matrix sae_random_inputs(int64_t n_samples, int64_t n_in, std::mt19937 & rng) {
    sae_matrix x(n_samples, n_in);
    std::normal_distribution<float> nd(0.0f, 1.0f);
    for (float & v : x.data) v = nd(rng);
    return x;
}

sae_matrix sae_random_grads(int64_t n_samples, int64_t k, std::mt19937 & rng) {
    return sae_random_inputs(n_samples, k, rng);
}
