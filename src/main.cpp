#include "cli.h"

#include <vector>

auto main(int argc, char *argv[]) -> int {
    std::vector<const char *> args(argv, argv + argc);
    return vaultrig::cli::run(args);
}
