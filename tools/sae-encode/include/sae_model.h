#pragma once

#include <cstdint>
#include <random>
#include <string>
#include <vector>

#include "sae-runner.h"

// Host copy of an encoder: weight M x D, bias of length M when has_bias.
struct sae_model {
    sae_matrix         weight;
    std::vector<float> bias;
    bool               has_bias = false;
    std::string        source; // GGUF path or "random"

    int64_t n_in()      const { return weight.cols; }
    int64_t n_latents() const { return weight.rows; }
};

// Reads `weight_name` ([D, M] in ggml order, any type with a to_float) and, if present,
// `bias_name` ([M]) from a GGUF file. Returns false and sets `error` on failure.
bool sae_model_load_gguf(
        const std::string & fname,
        const std::string & weight_name,
        const std::string & bias_name,
        sae_model         & out,
        std::string       & error);

// Gaussian weight with std 1/sqrt(D) and a small gaussian bias.
sae_model sae_model_random(int64_t n_in, int64_t n_latents, bool use_bias, std::mt19937 & rng);

// N x D standard-normal inputs.
sae_matrix sae_random_inputs(int64_t n_samples, int64_t n_in, std::mt19937 & rng);

// N x k standard-normal upstream gradients.
sae_matrix sae_random_grads(int64_t n_samples, int64_t k, std::mt19937 & rng);
