#pragma once

#include <atomic>
#include <string>
#include <vector>

struct ProcessResult
{
    int exitCode = -1;      // exit status, 128 + signal when killed
    std::string diagnostic; // tail of the child's stderr
    bool aborted = false;   // terminated because the abort flag was raised
};

// Run argv[0] from PATH and wait for it. stdout is discarded, stderr is captured.
// When abort becomes true the child receives SIGTERM (SIGKILL after a grace period).
// Throws std::runtime_error if the child could not be started.
ProcessResult run_process(const std::vector<std::string> &argv, const std::atomic<bool> &abort);

// Shell-like rendering of an argument vector for log lines
std::string join_command_line(const std::vector<std::string> &argv);
