#pragma once

namespace agentfs::cli {

/// Entry point for the `agentfs` executable. Returns the process exit code.
int run_cli(int argc, char **argv);

} // namespace agentfs::cli
