#pragma once

#include "sae_cli.h"

// Runs the encoder tool end to end. Returns the process exit code.
int sae_run(const sae_args & args);
