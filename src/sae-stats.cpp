#include "sae-stats.h"

#include <algorithm>
#include <stdexcept>
#include <string>

int64_t sae_latent_stats::n_dead() const {
    return (int64_t) std::count(fire_count.begin(), fire_count.end(), (int64_t) 0);
}

double sae_latent_stats::frac_nonzero_pre() const {
    const int64_t n = n_samples * n_latents;
    return n > 0 ? (double) n_nonzero_pre / (double) n : 0.0;
}

double sae_latent_stats::mean_top_act() const {
    int64_t n_sel = 0;
    for (int64_t c : fire_count) n_sel += c;
    return n_sel > 0 ? sum_top_act / (double) n_sel : 0.0;
}

void sae_latent_stats_add(sae_latent_stats & stats, const sae_forward_result & fwd) {
    const int64_t N = fwd.pre_acts.rows;
    const int64_t M = fwd.pre_acts.cols;

    if (stats.fire_count.empty()) {
        stats.n_latents = M;
        stats.fire_count.assign((size_t) M, 0);
    } else if (stats.n_latents != M) {
        throw std::invalid_argument("latent stats: mixing results with " + std::to_string(stats.n_latents) +
                " and " + std::to_string(M) + " latents");
    }

    for (int64_t n = 0; n < N; ++n) {
        for (int64_t j = 0; j < fwd.k; ++j) {
            stats.fire_count[(size_t) fwd.index(n, j)] += 1;
            const float v = fwd.top_acts.at(n, j);
            stats.sum_top_act += v;
            stats.max_top_act = std::max(stats.max_top_act, v);
        }
    }

    for (float v : fwd.pre_acts.data) {
        if (v > 0.0f) stats.n_nonzero_pre++;
    }
    stats.n_samples += N;
}
