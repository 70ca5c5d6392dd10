#pragma once

namespace slotwatch::cli {

/// Entry point for `slotwatch [--config <path>] <command>`. Returns the process exit code.
int run_cli(int argc, char **argv);

} // namespace slotwatch::cli
