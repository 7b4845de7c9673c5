#include "slotkeeper/cli/commands.hpp"

int main(int argc, char **argv) { return slotkeeper::cli::run_cli(argc, argv); }
