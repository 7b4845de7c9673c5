#pragma once

namespace slotkeeper::cli {

/// Entry point of the `slotkeeper` executable. Returns the process exit code: 0 on success,
/// 2 when a write was rejected with a conflict, 1 for every other failure.
int run_cli(int argc, char **argv);

} // namespace slotkeeper::cli
