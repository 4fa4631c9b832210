#include "include/sae_config.h"

#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

using json = nlohmann::ordered_json;

namespace {

struct sae_config_ctx {
    bool strict = false;
    sae_config_result & res;

    // returns false once an error was recorded
    bool unknown(const std::string & key) {
        if (strict) {
            res.error = "unknown key in config: " + key;
            return false;
        }
        res.warnings.push_back("unknown key in config: " + key);
        return true;
    }

    bool type_error(const std::string & key, const char * expected) {
        res.error = "config key '" + key + "' must be " + expected;
        return false;
    }
};

bool read_int(sae_config_ctx & c, const std::string & key, const json & v, int64_t & out) {
    if (!v.is_number_integer()) return c.type_error(key, "an integer");
    out = v.get<int64_t>();
    return true;
}

bool read_float(sae_config_ctx & c, const std::string & key, const json & v, float & out) {
    if (!v.is_number()) return c.type_error(key, "a number");
    out = v.get<float>();
    return true;
}

bool read_bool(sae_config_ctx & c, const std::string & key, const json & v, bool & out) {
    if (!v.is_boolean()) return c.type_error(key, "a boolean");
    out = v.get<bool>();
    return true;
}

bool parse_quantization(sae_config_ctx & c, const json & q, sae_args & args) {
    if (q.is_boolean()) {
        args.quantization = q.get<bool>();
        return true;
    }
    if (!q.is_object()) return c.type_error("quantization", "an object or a boolean");

    for (auto it = q.begin(); it != q.end(); ++it) {
        const std::string key = "quantization." + it.key();
        const json & v = it.value();
        if (it.key() == "enabled") {
            if (!read_bool(c, key, v, args.quantization)) return false;
        } else if (it.key() == "min_val") {
            if (!read_float(c, key, v, args.min_val)) return false;
        } else if (it.key() == "max_val") {
            if (!read_float(c, key, v, args.max_val)) return false;
        } else if (it.key() == "levels") {
            int64_t levels = 0;
            if (!read_int(c, key, v, levels)) return false;
            args.levels = (int32_t) levels;
        } else if (it.key() == "seed") {
            if (!v.is_number_unsigned()) return c.type_error(key, "a non-negative integer");
            args.quant_seed = v.get<uint64_t>();
        } else if (!c.unknown(key)) {
            return false;
        }
    }
    return true;
}

bool apply_config(sae_config_ctx & c, const json & j, sae_args & args) {
    if (!j.is_object()) {
        c.res.error = "config root must be a JSON object";
        return false;
    }

    for (auto it = j.begin(); it != j.end(); ++it) {
        const std::string & key = it.key();
        const json & v = it.value();
        int64_t iv = 0;

        if (key == "k") {
            if (!read_int(c, key, v, args.k)) return false;
        } else if (key == "activation") {
            if (!v.is_string()) return c.type_error(key, "a string");
            args.activation = v.get<std::string>();
        } else if (key == "quantization") {
            if (!parse_quantization(c, v, args)) return false;
        } else if (key == "bias") {
            if (!read_bool(c, key, v, args.use_bias)) return false;
        } else if (key == "seed") {
            if (!read_int(c, key, v, iv)) return false;
            args.seed = (int) iv;
        } else if (key == "threads") {
            if (!read_int(c, key, v, iv)) return false;
            if (iv <= 0) return c.type_error(key, "> 0");
            args.n_threads = (int) iv;
        } else if (key == "n_samples") {
            if (!read_int(c, key, v, args.n_samples)) return false;
        } else if (key == "n_in") {
            if (!read_int(c, key, v, args.n_in)) return false;
        } else if (key == "n_latents") {
            if (!read_int(c, key, v, args.n_latents)) return false;
        } else if (!c.unknown(key)) {
            return false;
        }
    }
    return true;
}

sae_config_result parse_stream(std::istream & in, const std::string & what, bool strict, sae_args & args) {
    sae_config_result res;
    json j;
    try {
        in >> j;
    } catch (const json::exception & e) {
        res.error = "failed to parse config JSON" + what + ": " + e.what();
        return res;
    }

    sae_config_ctx c{strict, res};
    sae_args tmp = args;
    if (!apply_config(c, j, tmp)) {
        return res;
    }
    args = std::move(tmp);
    res.ok = true;
    return res;
}

} // namespace

sae_config_result sae_config_load(const std::string & path, bool strict, sae_args & args) {
    std::ifstream in(path);
    if (!in) {
        sae_config_result res;
        res.error = "failed to open config file " + path;
        return res;
    }
    return parse_stream(in, " " + path, strict, args);
}

sae_config_result sae_config_parse(const std::string & text, bool strict, sae_args & args) {
    std::istringstream in(text);
    return parse_stream(in, "", strict, args);
}
