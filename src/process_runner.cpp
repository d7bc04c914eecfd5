#include "process_runner.h"
#include "logger.h"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <stdexcept>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace
{
    constexpr size_t kDiagnosticTail = 4096;
    constexpr int kPollIntervalMs = 200;
    constexpr auto kKillGrace = std::chrono::seconds(10);

    void append_tail(std::string &tail, const char *data, size_t len)
    {
        tail.append(data, len);
        if (tail.size() > kDiagnosticTail)
            tail.erase(0, tail.size() - kDiagnosticTail);
    }

    int decode_status(int status)
    {
        if (WIFEXITED(status))
            return WEXITSTATUS(status);
        if (WIFSIGNALED(status))
            return 128 + WTERMSIG(status);
        return 1;
    }
}

std::string join_command_line(const std::vector<std::string> &argv)
{
    std::string line;
    for (const auto &arg : argv)
    {
        if (!line.empty())
            line += ' ';
        if (arg.find_first_of(" '\"") != std::string::npos)
            line += "'" + arg + "'";
        else
            line += arg;
    }
    return line;
}

ProcessResult run_process(const std::vector<std::string> &argv, const std::atomic<bool> &abort)
{
    if (argv.empty())
        throw std::invalid_argument("run_process: empty argument vector");

    std::vector<char *> child_argv;
    child_argv.reserve(argv.size() + 1);
    for (const auto &arg : argv)
        child_argv.push_back(const_cast<char *>(arg.c_str()));
    child_argv.push_back(nullptr);

    int err_pipe[2];
    if (pipe(err_pipe) != 0)
        throw std::runtime_error(std::string("pipe failed: ") + std::strerror(errno));

    pid_t pid = fork();
    if (pid < 0)
    {
        int saved = errno;
        close(err_pipe[0]);
        close(err_pipe[1]);
        throw std::runtime_error(std::string("fork failed: ") + std::strerror(saved));
    }
    if (pid == 0)
    {
        dup2(err_pipe[1], STDERR_FILENO);
        close(err_pipe[0]);
        close(err_pipe[1]);
        int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0)
        {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDOUT_FILENO);
            close(devnull);
        }
        execvp(child_argv[0], child_argv.data());
        fprintf(stderr, "Failed to exec '%s': %s\n", child_argv[0], std::strerror(errno));
        _exit(127);
    }

    close(err_pipe[1]);
    LOG_DEBUG("Started pid %d: %s", static_cast<int>(pid), argv[0].c_str());

    ProcessResult result;
    bool term_sent = false;
    std::chrono::steady_clock::time_point term_time;
    bool pipe_open = true;
    char buf[1024];

    while (pipe_open)
    {
        if (abort.load() && !term_sent)
        {
            LOG_VERBOSE("Stopping pid %d", static_cast<int>(pid));
            kill(pid, SIGTERM);
            term_sent = true;
            result.aborted = true;
            term_time = std::chrono::steady_clock::now();
        }
        else if (term_sent && std::chrono::steady_clock::now() - term_time > kKillGrace)
        {
            kill(pid, SIGKILL);
        }

        pollfd pfd{err_pipe[0], POLLIN, 0};
        int ready = poll(&pfd, 1, kPollIntervalMs);
        if (ready < 0)
        {
            if (errno == EINTR)
                continue;
            LOG_WARN("poll on child stderr failed: %s", std::strerror(errno));
            break;
        }
        if (ready == 0)
            continue;

        ssize_t n = read(err_pipe[0], buf, sizeof(buf));
        if (n > 0)
            append_tail(result.diagnostic, buf, static_cast<size_t>(n));
        else if (n == 0 || errno != EINTR)
            pipe_open = false;
    }
    close(err_pipe[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0)
    {
        if (errno != EINTR)
        {
            LOG_ERROR("Failed to wait for pid %d: %s", static_cast<int>(pid), std::strerror(errno));
            result.exitCode = 1;
            return result;
        }
    }

    result.exitCode = decode_status(status);
    return result;
}
