#pragma once

#include "sae-runner.h"

#include <cstdint>
#include <vector>

// Latent usage diagnostics over one or more forward results.
struct sae_latent_stats {
    int64_t n_samples = 0;
    int64_t n_latents = 0;

    std::vector<int64_t> fire_count; // times each latent was selected
    int64_t n_nonzero_pre = 0;       // pre-activations > 0
    double  sum_top_act   = 0.0;
    float   max_top_act   = 0.0f;

    int64_t n_dead() const;          // latents never selected
    double  frac_nonzero_pre() const;
    double  mean_top_act() const;
};

// Accumulates `fwd` into `stats` (initialised on first use).
void sae_latent_stats_add(sae_latent_stats & stats, const sae_forward_result & fwd);
