#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "sae-encoder.h"
#include "sae-stats.h"

struct sae_grad_check {
    double tol         = 0.0;
    double diff_input  = 0.0;
    double diff_weight = 0.0;
    std::optional<double> diff_bias;
    bool   passed = false;
};

struct sae_run_report {
    std::string source;
    int64_t n_samples = 0;
    int64_t n_in      = 0;
    int64_t n_latents = 0;
    bool    has_bias  = false;
    bool    weight_f16 = false;
    int     n_threads = 1;
    int     repeat    = 1;

    sae_encoder_params params;
    uint64_t noise_seed = 0; // of the last forward call

    double forward_ms  = 0.0; // mean over repeats
    double backward_ms = -1.0;

    sae_latent_stats stats;
    std::optional<double> quant_mean_err; // mean(quantized - rectified)
    std::optional<sae_grad_check> grad_check;
};

struct sae_report_result {
    bool ok = false;
    std::string error;
};

std::string sae_report_to_json(const sae_run_report & report);

sae_report_result sae_write_report_json(const std::string & path, const sae_run_report & report);
