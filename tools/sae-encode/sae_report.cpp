#include "include/sae_report.h"

#include <fstream>

#include <nlohmann/json.hpp>

using json = nlohmann::ordered_json;

std::string sae_report_to_json(const sae_run_report & r) {
    json j;
    j["version"] = 1;
    j["source"]  = r.source;

    j["shape"] = json::object();
    j["shape"]["n_samples"] = r.n_samples;
    j["shape"]["n_in"]      = r.n_in;
    j["shape"]["n_latents"] = r.n_latents;

    json enc = json::object();
    enc["k"]          = r.params.k;
    enc["activation"] = sae_activation_name(r.params.activation);
    enc["bias"]       = r.has_bias;
    enc["weight_type"] = r.weight_f16 ? "f16" : "f32";
    json q = json::object();
    q["enabled"] = r.params.quantization;
    if (r.params.quantization) {
        q["min_val"] = r.params.quant.min_val;
        q["max_val"] = r.params.quant.max_val;
        q["levels"]  = r.params.quant.levels;
        q["seed"]    = r.noise_seed;
        q["seed_pinned"] = r.params.seed.has_value();
    }
    enc["quantization"] = std::move(q);
    j["encoder"] = std::move(enc);

    j["run"] = json::object();
    j["run"]["threads"] = r.n_threads;
    j["run"]["repeat"]  = r.repeat;
    j["run"]["forward_ms"] = r.forward_ms;
    if (r.backward_ms >= 0.0) {
        j["run"]["backward_ms"] = r.backward_ms;
    }

    const sae_latent_stats & s = r.stats;
    json st = json::object();
    st["n_samples"]        = s.n_samples;
    st["dead_latents"]     = s.n_dead();
    st["frac_nonzero_pre"] = s.frac_nonzero_pre();
    st["mean_top_act"]     = s.mean_top_act();
    st["max_top_act"]      = s.max_top_act;
    if (r.quant_mean_err.has_value()) {
        st["quant_mean_err"] = *r.quant_mean_err;
    }
    j["stats"] = std::move(st);

    if (r.grad_check.has_value()) {
        const sae_grad_check & g = *r.grad_check;
        json gc = json::object();
        gc["tol"]         = g.tol;
        gc["diff_input"]  = g.diff_input;
        gc["diff_weight"] = g.diff_weight;
        if (g.diff_bias.has_value()) {
            gc["diff_bias"] = *g.diff_bias;
        }
        gc["passed"] = g.passed;
        j["grad_check"] = std::move(gc);
    }

    return j.dump(2);
}

sae_report_result sae_write_report_json(const std::string & path, const sae_run_report & report) {
    sae_report_result res;

    std::ofstream out(path);
    if (!out) {
        res.error = "failed to open report path: " + path;
        return res;
    }
    out << sae_report_to_json(report) << "\n";
    if (!out) {
        res.error = "failed to write report: " + path;
        return res;
    }

    res.ok = true;
    return res;
}
