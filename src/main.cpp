#include "agentfs/cli/commands.hpp"

int main(int argc, char **argv) { return agentfs::cli::run_cli(argc, argv); }
