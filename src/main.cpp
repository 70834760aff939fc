#include "pairgate/cli/commands.hpp"

int main(int argc, char **argv) { return pairgate::cli::run_cli(argc, argv); }
