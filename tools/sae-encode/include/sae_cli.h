#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "sae-encoder.h"

struct sae_args {
    std::string model_fname;
    std::string weight_name = "encoder.weight";
    std::string bias_name   = "encoder.bias";

    int64_t n_in      = 64;
    int64_t n_latents = 512;
    int64_t n_samples = 256;
    bool    use_bias  = true;
    bool    weight_f16 = false;

    int64_t     k = 32;
    std::string activation = "topk";

    bool    quantization = false;
    float   min_val = 0.0f;
    float   max_val = 6.0f;
    int32_t levels  = 16;
    std::optional<uint64_t> quant_seed;

    bool backward   = false;
    bool check_grad = false;
    int  repeat     = 1;

    std::string config_file;
    bool        config_strict = false;
    std::string report_json;

    int n_threads = 1;
    int seed = 1234;
};

bool sae_parse_args(int argc, char ** argv, sae_args & args);

// Throws std::invalid_argument for an unknown activation name.
sae_encoder_params sae_args_to_params(const sae_args & args);
