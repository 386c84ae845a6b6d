#pragma once

#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME), falling back to the temp dir.
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Block SIGINT/SIGTERM in the calling thread (and threads it spawns later)
// and return once one of them is delivered or stop_waiting_for_signal() is called.
void block_termination_signals();
int wait_for_termination_signal();
void stop_waiting_for_signal();

} // namespace platform
