#pragma once

namespace switchboard::cli {

/// Entry point for `switchboard [--config PATH] <command> [options]`.
[[nodiscard]] int run_cli(int argc, char **argv);

} // namespace switchboard::cli
