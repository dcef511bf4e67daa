#pragma once

namespace clawguard::cli {

void print_help();
int run_cli(int argc, char **argv);

} // namespace clawguard::cli
