#include <macsweep/process.hpp>
#include <macsweep/utils.hpp>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <sstream>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

static int exit_code(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    return -1;
}

// Reads the child's stdout until EOF or the deadline.
static bool collect_output(int fd, std::chrono::steady_clock::time_point deadline, std::string& out) {
    char buf[4096];
    pollfd event{fd, POLLIN, 0};
    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            return false;
        }
        switch (poll(&event, 1, static_cast<int>(remaining))) {
            case -1:
                if (errno == EINTR) {
                    continue;
                }
                spdlog::error("failed to poll child output: {}", strerror(errno));
                return true;
            case 0:
                continue;
            default:
                break;
        }

        auto len = read(fd, buf, sizeof(buf));
        if (len < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("failed to read child output: {}", strerror(errno));
            return true;
        } else if (len == 0) {
            return true;
        }
        out.append(buf, static_cast<size_t>(len));
    }
}

ProcessResult run_process(const std::vector<std::string>& argv, std::chrono::milliseconds timeout, bool capture) {
    ProcessResult ret;
    if (argv.empty()) {
        return ret;
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    int devnull = open("/dev/null", O_RDWR | O_CLOEXEC);
    if (devnull < 0) {
        spdlog::error("failed to open /dev/null: {}", strerror(errno));
        return ret;
    }
    int out_pipe[2] = {-1, -1};
    auto guard = finally([&devnull, &out_pipe] {
        close(devnull);
        for (auto fd : out_pipe) {
            if (fd >= 0) {
                close(fd);
            }
        }
    });
    if (capture && pipe2(out_pipe, O_CLOEXEC) != 0) {
        spdlog::error("failed to create pipe: {}", strerror(errno));
        return ret;
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    pid_t pid = fork();
    if (pid < 0) {
        spdlog::warn("failed to start {}: {}", argv.front(), strerror(errno));
        return ret;
    }
    if (pid == 0) {
        dup2(devnull, STDIN_FILENO);
        dup2(capture ? out_pipe[1] : devnull, STDOUT_FILENO);
        dup2(devnull, STDERR_FILENO);
        execvp(args[0], args.data());
        _exit(127);
    }
    ret.started = true;

    if (capture) {
        close(out_pipe[1]);
        out_pipe[1] = -1;
        ret.timed_out = !collect_output(out_pipe[0], deadline, ret.output);
    }

    int status = 0;
    while (!ret.timed_out) {
        auto rc = waitpid(pid, &status, WNOHANG);
        if (rc == pid) {
            ret.exit_code = exit_code(status);
            return ret;
        } else if (rc < 0 && errno != EINTR) {
            spdlog::error("failed to wait for {}: {}", argv.front(), strerror(errno));
            return ret;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            ret.timed_out = true;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    spdlog::trace("{} timed out, killing pid {}", argv.front(), pid);
    kill(pid, SIGKILL);
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    return ret;
}

std::vector<std::string> split_command(const std::string& cmd) {
    std::vector<std::string> ret;
    std::istringstream stream{cmd};
    std::string arg;
    while (stream >> arg) {
        ret.push_back(arg);
    }
    return ret;
}
