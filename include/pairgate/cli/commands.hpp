#pragma once

namespace pairgate::cli {

int run_cli(int argc, char **argv);

} // namespace pairgate::cli
