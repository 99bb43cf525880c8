#include "webfetch/cli/commands.hpp"

int main(int argc, char **argv) { return webfetch::cli::run_cli(argc, argv); }
