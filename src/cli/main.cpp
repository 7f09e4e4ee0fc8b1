#include <cstdlib>

#include "cop/cli/app.hpp"

int main(int argc, char** argv) {
    if (argc < 1 || argv == nullptr) {
        return EXIT_FAILURE;
    }
    const cop::cli::CliArgs args{argv + 1, static_cast<cop::cli::u32>(argc - 1)};
    return cop::cli::run(args, cop::cli::config_from_env());
}
