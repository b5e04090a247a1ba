#include "Process.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

constexpr int kExecFailedStatus = 127;

struct Pipe {
    int read_end{-1};
    int write_end{-1};

    bool open()
    {
        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) != 0) {
            return false;
        }
        read_end = fds[0];
        write_end = fds[1];
        return true;
    }

    void close_read() { if (read_end >= 0) { ::close(read_end); read_end = -1; } }
    void close_write() { if (write_end >= 0) { ::close(write_end); write_end = -1; } }

    ~Pipe()
    {
        close_read();
        close_write();
    }
};

void write_all(int fd, const std::string& data)
{
    std::size_t written = 0;
    while (written < data.size()) {
        const ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return;
        }
        written += static_cast<std::size_t>(n);
    }
}

void drain(Pipe& out, Pipe& err, ProcessResult& result)
{
    char buffer[4096];
    pollfd fds[2] = {{out.read_end, POLLIN, 0}, {err.read_end, POLLIN, 0}};
    int open_streams = 2;
    while (open_streams > 0) {
        if (::poll(fds, 2, -1) < 0) {
            if (errno == EINTR) {
                continue;
            }
            return;
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                continue;
            }
            const ssize_t n = ::read(fds[i].fd, buffer, sizeof(buffer));
            if (n > 0) {
                (i == 0 ? result.stdout_text : result.stderr_text).append(buffer, static_cast<std::size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                fds[i].fd = -1;
                --open_streams;
            }
        }
    }
}

}

namespace Process {

ProcessResult run(const std::vector<std::string>& argv, const std::string* stdin_data)
{
    ProcessResult result;
    if (argv.empty()) {
        return result;
    }

    Pipe in;
    Pipe out;
    Pipe err;
    if (!in.open() || !out.open() || !err.open()) {
        result.stderr_text = std::strerror(errno);
        return result;
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid < 0) {
        result.stderr_text = std::strerror(errno);
        return result;
    }

    if (pid == 0) {
        ::dup2(in.read_end, STDIN_FILENO);
        ::dup2(out.write_end, STDOUT_FILENO);
        ::dup2(err.write_end, STDERR_FILENO);
        ::execvp(args[0], args.data());
        _exit(kExecFailedStatus);
    }

    in.close_read();
    out.close_write();
    err.close_write();

    // A child that exits before reading stdin must not kill us with SIGPIPE.
    struct sigaction ignore_pipe{};
    struct sigaction previous{};
    ignore_pipe.sa_handler = SIG_IGN;
    ::sigaction(SIGPIPE, &ignore_pipe, &previous);
    if (stdin_data) {
        write_all(in.write_end, *stdin_data);
    }
    in.close_write();
    ::sigaction(SIGPIPE, &previous, nullptr);

    drain(out, err, result);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            result.stderr_text += std::strerror(errno);
            return result;
        }
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
        result.launched = result.exit_code != kExecFailedStatus || !result.stderr_text.empty();
    } else if (WIFSIGNALED(status)) {
        result.launched = true;
        result.exit_code = 128 + WTERMSIG(status);
    }
    return result;
}

}
