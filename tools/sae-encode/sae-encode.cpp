#include "include/sae_cli.h"
#include "include/sae_runner.h"

int main(int argc, char ** argv) {
    sae_args args;
    if (!sae_parse_args(argc, argv, args)) {
        return 1;
    }
    return sae_run(args);
}
