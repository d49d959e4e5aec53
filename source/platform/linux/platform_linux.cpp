#include "platform/platform_abi.hpp"

#include <unistd.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <spawn.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <thread>
#include <chrono>
#include <filesystem>

extern char **environ;

namespace platform {

namespace {

bool set_non_blocking(int descriptor) {
    int flags = fcntl(descriptor, F_GETFL, 0);
    if (flags < 0) {
        return false;
    }
    return fcntl(descriptor, F_SETFL, flags | O_NONBLOCK) == 0;
}

// Pipe pairs whose ends are all close-on-exec; dup2 in the child clears the
// flag on the copies that become fds 0, 1 and 2.
struct PipePair {
    int read_end = -1;
    int write_end = -1;
};

bool open_pipe(PipePair &pair) {
    int descriptors[2];
    if (pipe2(descriptors, O_CLOEXEC) != 0) {
        return false;
    }
    pair.read_end = descriptors[0];
    pair.write_end = descriptors[1];
    return true;
}

void close_pair(PipePair &pair) {
    close_descriptor(pair.read_end);
    close_descriptor(pair.write_end);
}

} // namespace

std::vector<std::string> build_environment(const EnvironmentMap &environment_overrides) {
    std::map<std::string, std::string> merged;
    for (char **entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string assignment(*entry);
        auto equals_position = assignment.find('=');
        if (equals_position == std::string::npos || equals_position == 0) {
            continue;
        }
        merged[assignment.substr(0, equals_position)] = assignment.substr(equals_position + 1);
    }
    for (const auto &override_entry : environment_overrides) {
        merged[override_entry.first] = override_entry.second;
    }

    std::vector<std::string> environment;
    environment.reserve(merged.size());
    for (const auto &entry : merged) {
        environment.push_back(entry.first + "=" + entry.second);
    }
    return environment;
}

SpawnResult spawn_piped_process(const std::vector<std::string> &argv,
                                const EnvironmentMap &environment_overrides) {
    SpawnResult result;

    if (argv.empty() || argv[0].empty()) {
        result.error_number = ENOENT;
        result.error_message = "empty command line";
        return result;
    }

    // We need mutable copies of strings for posix_spawn.
    std::vector<std::string> argv_strings = argv;
    std::vector<char *> argv_pointers;
    for (auto &argument_string : argv_strings) {
        argv_pointers.push_back(argument_string.data());
    }
    argv_pointers.push_back(nullptr);

    std::vector<std::string> environment_strings = build_environment(environment_overrides);
    std::vector<char *> environment_pointers;
    for (auto &environment_string : environment_strings) {
        environment_pointers.push_back(environment_string.data());
    }
    environment_pointers.push_back(nullptr);

    PipePair input_pipe;
    PipePair output_pipe;
    PipePair error_pipe;
    if (!open_pipe(input_pipe) || !open_pipe(output_pipe) || !open_pipe(error_pipe)) {
        result.error_number = errno;
        result.error_message = "pipe2 failed: " + std::string(strerror(errno));
        close_pair(input_pipe);
        close_pair(output_pipe);
        close_pair(error_pipe);
        return result;
    }

    posix_spawn_file_actions_t file_actions;
    posix_spawn_file_actions_init(&file_actions);
    posix_spawn_file_actions_adddup2(&file_actions, input_pipe.read_end, STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&file_actions, output_pipe.write_end, STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&file_actions, error_pipe.write_end, STDERR_FILENO);

    // The dispatcher ignores SIGPIPE; providers should start with the default.
    posix_spawnattr_t attributes;
    posix_spawnattr_init(&attributes);
    sigset_t default_signals;
    sigemptyset(&default_signals);
    sigaddset(&default_signals, SIGPIPE);
    posix_spawnattr_setsigdefault(&attributes, &default_signals);
    posix_spawnattr_setflags(&attributes, POSIX_SPAWN_SETSIGDEF);

    pid_t child_pid = 0;
    int spawn_status = 0;
    if (argv[0].find('/') == std::string::npos) {
        spawn_status = posix_spawnp(&child_pid, argv[0].c_str(), &file_actions, &attributes,
                                    argv_pointers.data(), environment_pointers.data());
    } else {
        spawn_status = posix_spawn(&child_pid, argv[0].c_str(), &file_actions, &attributes,
                                   argv_pointers.data(), environment_pointers.data());
    }

    posix_spawn_file_actions_destroy(&file_actions);
    posix_spawnattr_destroy(&attributes);

    // Child ends belong to the child now.
    close_descriptor(input_pipe.read_end);
    close_descriptor(output_pipe.write_end);
    close_descriptor(error_pipe.write_end);

    if (spawn_status != 0) {
        result.error_number = spawn_status;
        result.error_message = "posix_spawn failed: " + std::string(strerror(spawn_status));
        close_pair(input_pipe);
        close_pair(output_pipe);
        close_pair(error_pipe);
        return result;
    }

    set_non_blocking(input_pipe.write_end);
    set_non_blocking(output_pipe.read_end);
    set_non_blocking(error_pipe.read_end);

    result.success = true;
    result.process_id = static_cast<int>(child_pid);
    result.stdin_descriptor = input_pipe.write_end;
    result.stdout_descriptor = output_pipe.read_end;
    result.stderr_descriptor = error_pipe.read_end;
    return result;
}

bool read_file_contents(const std::string &file_path, std::string &output_contents) {
    std::ifstream file_stream(file_path);
    if (!file_stream.is_open()) {
        return false;
    }
    std::ostringstream string_stream;
    string_stream << file_stream.rdbuf();
    output_contents = string_stream.str();
    return true;
}

bool wait_for_file(const std::string &file_path, int timeout_milliseconds) {
    const int poll_interval_milliseconds = 20;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_milliseconds);

    while (true) {
        std::error_code error;
        if (std::filesystem::exists(file_path, error)) {
            std::string contents;
            if (read_file_contents(file_path, contents) && !contents.empty()) {
                return true;
            }
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(poll_interval_milliseconds));
    }
}

bool signal_process(int process_id, int signal_number) {
    if (process_id <= 0) {
        return false;
    }
    return kill(static_cast<pid_t>(process_id), signal_number) == 0;
}

bool try_reap_process(int process_id, int &exit_code) {
    if (process_id <= 0) {
        return false;
    }
    int status = 0;
    pid_t reaped = waitpid(static_cast<pid_t>(process_id), &status, WNOHANG);
    if (reaped == 0) {
        return false;
    }
    if (reaped < 0) {
        // ECHILD: someone else reaped it; report an abnormal exit.
        exit_code = -1;
        return errno != EINTR;
    }
    if (WIFEXITED(status)) {
        exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_code = 128 + WTERMSIG(status);
    } else {
        return false;
    }
    return true;
}

void reap_process(int process_id) {
    if (process_id <= 0) {
        return;
    }
    int status = 0;
    while (waitpid(static_cast<pid_t>(process_id), &status, 0) < 0 && errno == EINTR) {
    }
}

void close_descriptor(int &descriptor) {
    if (descriptor >= 0) {
        close(descriptor);
        descriptor = -1;
    }
}

std::string home_directory() {
    const char *home = std::getenv("HOME");
    if (home != nullptr && home[0] != '\0') {
        return std::string(home);
    }
    return "/tmp";
}

} // namespace platform
