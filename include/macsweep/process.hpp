#ifndef MACSWEEP_PROCESS_HPP
#define MACSWEEP_PROCESS_HPP

#include <chrono>
#include <string>
#include <vector>

struct ProcessResult {
    bool started{false};
    bool timed_out{false};
    // -1 unless the child exited normally
    int exit_code{-1};
    std::string output;

    bool ok() const {
        return started && !timed_out && exit_code == 0;
    }
};

// Runs argv[0] (looked up in PATH) with stdin and stderr on /dev/null. Stdout
// is collected when `capture` is set and discarded otherwise. A child still
// running after `timeout` is killed.
ProcessResult run_process(const std::vector<std::string>& argv, std::chrono::milliseconds timeout, bool capture);

// Splits a command line on whitespace. No quoting.
std::vector<std::string> split_command(const std::string& cmd);

#endif
