#pragma once

#include <string>
#include <vector>

#include "sae_cli.h"

struct sae_config_result {
    bool ok = false;
    std::string error;
    std::vector<std::string> warnings;
};

// Applies the JSON config at `path` on top of `args`. Keys missing from the file keep
// their current values. Unknown keys are warnings, or errors when `strict` is set.
sae_config_result sae_config_load(const std::string & path, bool strict, sae_args & args);

// Same as sae_config_load on an in-memory document.
sae_config_result sae_config_parse(const std::string & text, bool strict, sae_args & args);
