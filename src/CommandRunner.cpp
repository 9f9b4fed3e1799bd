#include "CommandRunner.h"
#include "Logger.h"
#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <initializer_list>
#include <poll.h>
#include <signal.h>
#include <sstream>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

void log_output(const char* stream, const std::string& text) {
    std::istringstream lines(text);
    std::string line;
    while (std::getline(lines, line)) {
        CHROOT_LOG_DEBUG("{}: {}", stream, line);
    }
}

} // namespace

std::string format_command(const std::vector<std::string>& argv) {
    std::string line;
    for (const auto& arg : argv) {
        if (!line.empty()) {
            line += ' ';
        }
        line += arg;
    }
    return line;
}

bool ProcessCommandRunner::has_tool(const std::string& name) {
    if (name.find('/') != std::string::npos) {
        return access(name.c_str(), X_OK) == 0;
    }
    const char* path_env = std::getenv("PATH");
    std::string path = path_env ? path_env : "/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin";

    std::istringstream dirs(path);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) {
            continue;
        }
        std::string candidate = dir + "/" + name;
        struct stat st {};
        if (stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
            access(candidate.c_str(), X_OK) == 0) {
            return true;
        }
    }
    return false;
}

CommandResult ProcessCommandRunner::run(const std::vector<std::string>& argv,
                                        const std::string& stdin_data) {
    CommandResult result;
    if (argv.empty()) {
        return result;
    }

    CHROOT_LOG_DEBUG("EXECUTING: {}", format_command(argv));

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (pipe2(in_pipe, O_CLOEXEC) != 0 || pipe2(out_pipe, O_CLOEXEC) != 0 ||
        pipe2(err_pipe, O_CLOEXEC) != 0) {
        CHROOT_LOG_ERROR("pipe failed for '{}': {}", argv[0], strerror(errno));
        for (int* p : {in_pipe, out_pipe, err_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        return result;
    }

    std::vector<char*> c_args;
    for (const auto& arg : argv) {
        c_args.push_back(const_cast<char*>(arg.c_str()));
    }
    c_args.push_back(nullptr);

    pid_t pid = fork();
    if (pid == -1) {
        CHROOT_LOG_ERROR("fork failed for '{}': {}", argv[0], strerror(errno));
        for (int* p : {in_pipe, out_pipe, err_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        return result;
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls until exec.
        dup2(in_pipe[0], STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        signal(SIGINT, SIG_DFL);
        signal(SIGTERM, SIG_DFL);
        signal(SIGPIPE, SIG_DFL);
        execvp(c_args[0], c_args.data());
        const char msg[] = "exec failed\n";
        ssize_t ignored = write(STDERR_FILENO, msg, sizeof(msg) - 1);
        (void)ignored;
        _exit(127);
    }

    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);

    // Feed stdin and drain both outputs together so a chatty child never
    // blocks on a full pipe.
    size_t written = 0;
    if (stdin_data.empty()) {
        close_fd(in_pipe[1]);
    }
    char buf[4096];
    while (out_pipe[0] >= 0 || err_pipe[0] >= 0 || in_pipe[1] >= 0) {
        struct pollfd fds[3];
        nfds_t count = 0;
        if (out_pipe[0] >= 0) fds[count++] = {out_pipe[0], POLLIN, 0};
        if (err_pipe[0] >= 0) fds[count++] = {err_pipe[0], POLLIN, 0};
        if (in_pipe[1] >= 0) fds[count++] = {in_pipe[1], POLLOUT, 0};

        if (poll(fds, count, -1) < 0) {
            if (errno == EINTR) {
                continue;
            }
            CHROOT_LOG_ERROR("poll failed while running '{}': {}", argv[0], strerror(errno));
            break;
        }

        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents == 0) {
                continue;
            }
            if (fds[i].fd == in_pipe[1]) {
                size_t chunk = std::min<size_t>(stdin_data.size() - written, PIPE_BUF);
                ssize_t n = write(in_pipe[1], stdin_data.data() + written, chunk);
                if (n > 0) {
                    written += static_cast<size_t>(n);
                }
                if (n < 0 && errno != EINTR && errno != EAGAIN) {
                    close_fd(in_pipe[1]);
                } else if (written >= stdin_data.size()) {
                    close_fd(in_pipe[1]);
                }
                continue;
            }
            ssize_t n = read(fds[i].fd, buf, sizeof(buf));
            if (n > 0) {
                (fds[i].fd == out_pipe[0] ? result.out : result.err).append(buf, static_cast<size_t>(n));
            } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                if (fds[i].fd == out_pipe[0]) {
                    close_fd(out_pipe[0]);
                } else {
                    close_fd(err_pipe[0]);
                }
            }
        }
    }
    close_fd(in_pipe[1]);
    close_fd(out_pipe[0]);
    close_fd(err_pipe[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            CHROOT_LOG_ERROR("waitpid failed for '{}': {}", argv[0], strerror(errno));
            return result;
        }
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }

    log_output("STDOUT", result.out);
    log_output("STDERR", result.err);
    if (result.exit_code != 0) {
        CHROOT_LOG_DEBUG("Command failed with exit code: {}", result.exit_code);
    }
    return result;
}
