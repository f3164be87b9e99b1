#include "Subprocess.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace ClipRelay {

ProcessResult RunProcess(const std::vector<std::string>& argv,
                         std::chrono::milliseconds timeout,
                         size_t max_output_bytes) {
    ProcessResult result;
    if (argv.empty()) {
        result.error = "empty command line";
        return result;
    }

    int pipe_fds[2];
    // Close-on-exec so children forked by concurrent calls never hold this pipe open.
    if (pipe2(pipe_fds, O_CLOEXEC) != 0) {
        result.error = std::string("pipe failed: ") + std::strerror(errno);
        return result;
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        result.error = std::string("fork failed: ") + std::strerror(errno);
        close(pipe_fds[0]);
        close(pipe_fds[1]);
        return result;
    }

    if (pid == 0) {
        // Child: stdout -> pipe, stderr -> /dev/null, default signal mask.
        sigset_t empty;
        sigemptyset(&empty);
        sigprocmask(SIG_SETMASK, &empty, nullptr);
        dup2(pipe_fds[1], STDOUT_FILENO);
        int devnull = open("/dev/null", O_WRONLY | O_CLOEXEC);
        if (devnull >= 0) dup2(devnull, STDERR_FILENO);
        close(pipe_fds[0]);
        close(pipe_fds[1]);
        execvp(args[0], args.data());
        _exit(127);
    }

    close(pipe_fds[1]);
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    char buf[8192];
    bool open_pipe = true;

    while (open_pipe) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            result.timed_out = true;
            break;
        }
        pollfd pfd{pipe_fds[0], POLLIN, 0};
        int rc = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (rc < 0) {
            if (errno == EINTR) continue;
            result.error = std::string("poll failed: ") + std::strerror(errno);
            break;
        }
        if (rc == 0) continue;

        ssize_t n = read(pipe_fds[0], buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            result.error = std::string("read failed: ") + std::strerror(errno);
            break;
        }
        if (n == 0) {
            open_pipe = false;
        } else if (result.output.size() < max_output_bytes) {
            result.output.append(buf, static_cast<size_t>(std::min<size_t>(static_cast<size_t>(n), max_output_bytes - result.output.size())));
        }
    }
    close(pipe_fds[0]);

    if (result.timed_out || !result.error.empty()) {
        kill(pid, SIGKILL);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            if (result.error.empty()) result.error = std::string("waitpid failed: ") + std::strerror(errno);
            return result;
        }
    }
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }
    return result;
}

}
