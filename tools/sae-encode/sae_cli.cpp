#include "include/sae_cli.h"
#include "include/sae_config.h"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <string>
#include <thread>

namespace {

[[noreturn]] void usage(const char * argv0) {
    printf("usage: %s [options]\n\n", argv0);
    printf("options:\n");
    printf("  -m, --model FILE     load encoder weight/bias from GGUF (default: random weights)\n");
    printf("  --weight-name NAME   weight tensor name in the GGUF (default: encoder.weight)\n");
    printf("  --bias-name NAME     bias tensor name in the GGUF (default: encoder.bias, missing => no bias)\n");
    printf("  --n-in D             input features of the random weight (default: 64)\n");
    printf("  --n-latents M        latents of the random weight (default: 512)\n");
    printf("  --n-samples N        random input rows (default: 256)\n");
    printf("  --no-bias            run the encoder without bias\n");
    printf("  --weight-f16         keep the weight as F16 in the graph\n");
    printf("  --k K                active latents per sample (default: 32)\n");
    printf("  --activation NAME    topk|groupmax (default: topk)\n");
    printf("  --quant              bounded rectifier + stochastic quantization\n");
    printf("  --min-val F          quantization grid minimum (default: 0)\n");
    printf("  --max-val F          quantization grid maximum (default: 6)\n");
    printf("  --levels N           quantization levels, >= 2 (default: 16)\n");
    printf("  --quant-seed N       pin the quantization noise seed (default: fresh per call)\n");
    printf("  --backward           run the sparse backward with random upstream gradients\n");
    printf("  --check-grad         compare the sparse backward against the dense reference (implies --backward)\n");
    printf("  --repeat N           forward repetitions (default: 1)\n");
    printf("  --config FILE        JSON config; flags after it override its values\n");
    printf("  --config-strict      reject unknown keys in the config (give before --config)\n");
    printf("  --report-json PATH   write the run report as JSON\n");
    printf("  -t, --threads N      worker threads (default: nproc)\n");
    printf("  --seed N             RNG seed for random weights/inputs (default: 1234)\n");
    exit(1);
}

bool parse_flags(int argc, char ** argv, sae_args & args) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if ((arg == "-m" || arg == "--model") && i + 1 < argc) { args.model_fname = argv[++i]; continue; }
        if (arg == "--weight-name" && i + 1 < argc) { args.weight_name = argv[++i]; continue; }
        if (arg == "--bias-name" && i + 1 < argc) { args.bias_name = argv[++i]; continue; }
        if (arg == "--n-in" && i + 1 < argc) { args.n_in = std::stoll(argv[++i]); continue; }
        if (arg == "--n-latents" && i + 1 < argc) { args.n_latents = std::stoll(argv[++i]); continue; }
        if (arg == "--n-samples" && i + 1 < argc) { args.n_samples = std::stoll(argv[++i]); continue; }
        if (arg == "--no-bias") { args.use_bias = false; continue; }
        if (arg == "--weight-f16") { args.weight_f16 = true; continue; }
        if (arg == "--k" && i + 1 < argc) { args.k = std::stoll(argv[++i]); continue; }
        if (arg == "--activation" && i + 1 < argc) { args.activation = argv[++i]; continue; }
        if (arg == "--quant") { args.quantization = true; continue; }
        if (arg == "--min-val" && i + 1 < argc) { args.min_val = std::stof(argv[++i]); continue; }
        if (arg == "--max-val" && i + 1 < argc) { args.max_val = std::stof(argv[++i]); continue; }
        if (arg == "--levels" && i + 1 < argc) { args.levels = std::stoi(argv[++i]); continue; }
        if (arg == "--quant-seed" && i + 1 < argc) { args.quant_seed = std::stoull(argv[++i]); continue; }
        if (arg == "--backward") { args.backward = true; continue; }
        if (arg == "--check-grad") { args.check_grad = true; args.backward = true; continue; }
        if (arg == "--repeat" && i + 1 < argc) { args.repeat = std::max(1, std::stoi(argv[++i])); continue; }
        if (arg == "--config-strict") { args.config_strict = true; continue; }
        if (arg == "--config" && i + 1 < argc) {
            args.config_file = argv[++i];
            const sae_config_result res = sae_config_load(args.config_file, args.config_strict, args);
            for (const auto & w : res.warnings) {
                fprintf(stderr, "sae-encode: warning: %s\n", w.c_str());
            }
            if (!res.ok) {
                fprintf(stderr, "sae-encode: %s\n", res.error.c_str());
                return false;
            }
            continue;
        }
        if (arg == "--report-json" && i + 1 < argc) { args.report_json = argv[++i]; continue; }
        if ((arg == "-t" || arg == "--threads") && i + 1 < argc) { args.n_threads = std::stoi(argv[++i]); continue; }
        if (arg == "--seed" && i + 1 < argc) { args.seed = std::stoi(argv[++i]); continue; }
        if (arg == "-h" || arg == "--help") {
            usage(argv[0]);
        }
        fprintf(stderr, "unknown argument: %s\n", arg.c_str());
        usage(argv[0]);
    }
    return true;
}

} // namespace

bool sae_parse_args(int argc, char ** argv, sae_args & args) {
    args.n_threads = (int) std::max(1u, std::thread::hardware_concurrency());

    try {
        if (!parse_flags(argc, argv, args)) {
            return false;
        }
    } catch (const std::exception & e) {
        fprintf(stderr, "sae-encode: invalid argument value (%s)\n", e.what());
        return false;
    }

    if (args.n_samples <= 0 || (args.model_fname.empty() && (args.n_in <= 0 || args.n_latents <= 0))) {
        fprintf(stderr, "sae-encode: --n-samples/--n-in/--n-latents must be > 0\n");
        return false;
    }

    return true;
}

sae_encoder_params sae_args_to_params(const sae_args & args) {
    sae_encoder_params params;
    params.k            = args.k;
    params.activation   = sae_activation_from_string(args.activation);
    params.quantization = args.quantization;
    params.quant.min_val = args.min_val;
    params.quant.max_val = args.max_val;
    params.quant.levels  = args.levels;
    params.seed          = args.quant_seed;
    return params;
}
