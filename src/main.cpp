#include "switchboard/cli/commands.hpp"

int main(int argc, char **argv) { return switchboard::cli::run_cli(argc, argv); }
