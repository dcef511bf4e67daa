#include "clawguard/cli/commands.hpp"

int main(int argc, char **argv) { return clawguard::cli::run_cli(argc, argv); }
