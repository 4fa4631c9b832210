#include "sae_cli.h"
#include "sae_config.h"
#include "sae_report.h"

#include <cstdio>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

bool test_parse_fields() {
    const std::string text = R"({
        "k": 8,
        "activation": "groupmax",
        "quantization": { "enabled": true, "min_val": 0.5, "max_val": 4.5, "levels": 5 },
        "bias": false,
        "seed": 77,
        "threads": 3,
        "n_samples": 100,
        "n_in": 20,
        "n_latents": 64
    })";

    sae_args args;
    const sae_config_result res = sae_config_parse(text, true, args);
    if (!res.ok) {
        std::cerr << "parse fields: " << res.error << "\n";
        return false;
    }
    if (args.k != 8 || args.activation != "groupmax" || !args.quantization || args.min_val != 0.5f ||
        args.max_val != 4.5f || args.levels != 5 || args.use_bias || args.seed != 77 || args.n_threads != 3 ||
        args.n_samples != 100 || args.n_in != 20 || args.n_latents != 64) {
        std::cerr << "parse fields: values not applied\n";
        return false;
    }

    const sae_encoder_params params = sae_args_to_params(args);
    if (params.k != 8 || params.activation != sae_activation::groupmax || !params.quantization ||
        params.quant.levels != 5) {
        std::cerr << "parse fields: encoder params not derived from args\n";
        return false;
    }
    return true;
}

bool test_unknown_keys() {
    const std::string text = R"({ "k": 4, "temperature": 0.7 })";

    sae_args lenient;
    const sae_config_result r1 = sae_config_parse(text, false, lenient);
    if (!r1.ok || r1.warnings.size() != 1 || lenient.k != 4) {
        std::cerr << "unknown keys: lenient mode should warn once and apply the rest\n";
        return false;
    }

    sae_args strict;
    const sae_config_result r2 = sae_config_parse(text, true, strict);
    if (r2.ok || r2.error.find("temperature") == std::string::npos) {
        std::cerr << "unknown keys: strict mode should reject 'temperature'\n";
        return false;
    }
    if (strict.k != sae_args{}.k) {
        std::cerr << "unknown keys: a rejected config must not modify the args\n";
        return false;
    }
    return true;
}

bool test_bad_documents() {
    sae_args args;
    if (sae_config_parse(R"({ "k": "eight" })", false, args).ok) {
        std::cerr << "bad documents: string k accepted\n";
        return false;
    }
    if (sae_config_parse(R"({ "k": 4, )", false, args).ok) {
        std::cerr << "bad documents: truncated JSON accepted\n";
        return false;
    }
    if (sae_config_parse(R"([1, 2])", false, args).ok) {
        std::cerr << "bad documents: array root accepted\n";
        return false;
    }
    if (sae_config_load("does-not-exist.json", false, args).ok) {
        std::cerr << "bad documents: missing file accepted\n";
        return false;
    }

    args.activation = "bogus";
    try {
        sae_args_to_params(args);
        std::cerr << "bad documents: bogus activation accepted\n";
        return false;
    } catch (const std::invalid_argument &) {
    }
    return true;
}

// flags are applied in order, so the config overrides flags before it and flags after it win
bool test_cli_override_order() {
    const std::string path = "test_sae_config_override.json";
    {
        std::ofstream out(path);
        out << R"({ "k": 16, "quantization": { "levels": 4 } })";
    }

    std::vector<std::string> argv_s = {
        "sae-encode", "--k", "2", "--levels", "9", "--config", path, "--levels", "8",
    };
    std::vector<char *> argv;
    for (auto & s : argv_s) argv.push_back(&s[0]);

    sae_args args;
    const bool parsed = sae_parse_args((int) argv.size(), argv.data(), args);
    std::remove(path.c_str());

    if (!parsed) {
        std::cerr << "override order: parse failed\n";
        return false;
    }
    if (args.k != 16 || args.levels != 8) {
        std::cerr << "override order: got k=" << args.k << " levels=" << args.levels << ", want k=16 levels=8\n";
        return false;
    }
    return true;
}

bool test_report_json() {
    sae_run_report report;
    report.source    = "random";
    report.n_samples = 4;
    report.n_in      = 3;
    report.n_latents = 8;
    report.params.k  = 2;
    report.params.quantization = true;
    report.noise_seed = 99;
    report.stats.n_latents = 8;
    report.stats.fire_count.assign(8, 0);
    report.stats.fire_count[1] = 4;

    sae_grad_check gc;
    gc.tol = 1e-3;
    gc.passed = true;
    report.grad_check = gc;

    const std::string j = sae_report_to_json(report);
    for (const char * want : { "\"n_latents\": 8", "\"activation\": \"topk\"", "\"seed\": 99",
                               "\"dead_latents\": 7", "\"passed\": true" }) {
        if (j.find(want) == std::string::npos) {
            std::cerr << "report json: missing " << want << "\n";
            return false;
        }
    }
    if (j.find("backward_ms") != std::string::npos) {
        std::cerr << "report json: backward_ms written for a forward-only run\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    bool ok = true;
    ok = test_parse_fields()        && ok;
    ok = test_unknown_keys()        && ok;
    ok = test_bad_documents()       && ok;
    ok = test_cli_override_order()  && ok;
    ok = test_report_json()         && ok;
    std::fputs(ok ? "test-sae-config: ok\n" : "test-sae-config: failed\n", stdout);
    return ok ? 0 : 1;
}
