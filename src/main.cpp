#include "slotwatch/cli/commands.hpp"

int main(int argc, char **argv) { return slotwatch::cli::run_cli(argc, argv); }
