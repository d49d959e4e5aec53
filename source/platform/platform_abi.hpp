#ifndef MCPDISPATCH_PLATFORM_ABI_HPP
#define MCPDISPATCH_PLATFORM_ABI_HPP

// Platform abstraction interface.
// Each OS-specific implementation lives under platform/<os>/ and provides
// definitions for the functions declared here.

#include <map>
#include <string>
#include <vector>

namespace platform {

using EnvironmentMap = std::map<std::string, std::string>;

// Result of spawning a child process with piped standard streams.
// On success the three descriptors are the parent's ends, close-on-exec
// and non-blocking; the caller owns them.
struct SpawnResult {
    bool success = false;
    int process_id = -1;
    int stdin_descriptor = -1;
    int stdout_descriptor = -1;
    int stderr_descriptor = -1;
    int error_number = 0; // errno reported by the spawn, 0 on success
    std::string error_message;
};

// Spawn argv[0] with the given argument vector. argv[0] containing no slash
// is looked up on PATH. The child environment is the current process
// environment with environment_overrides applied on top.
SpawnResult spawn_piped_process(const std::vector<std::string> &argv,
                                const EnvironmentMap &environment_overrides);

// Build "NAME=value" entries from the current environment merged with overrides.
std::vector<std::string> build_environment(const EnvironmentMap &environment_overrides);

// Read the entire contents of a text file into a string.
// Returns true on success, false on failure (file not found, permission, etc.).
bool read_file_contents(const std::string &file_path, std::string &output_contents);

// Wait (poll) until a file exists and is non-empty, up to timeout_milliseconds.
// Returns true if the file appeared, false if timed out.
bool wait_for_file(const std::string &file_path, int timeout_milliseconds);

// Send signal_number to a process. Returns false for invalid ids or on error.
bool signal_process(int process_id, int signal_number);

// Non-blocking reap. Returns true and fills exit_code once the process has
// exited; a process killed by a signal reports 128 + signal number.
bool try_reap_process(int process_id, int &exit_code);

// Blocking reap, used on shutdown after a forced kill.
void reap_process(int process_id);

// Close a descriptor if it is valid, then set it to -1.
void close_descriptor(int &descriptor);

// Current user's home directory ($HOME, falling back to /tmp).
std::string home_directory();

} // namespace platform

#endif // MCPDISPATCH_PLATFORM_ABI_HPP
