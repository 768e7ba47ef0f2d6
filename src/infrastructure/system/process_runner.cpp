// EN: Implementation of the POSIX process runner.
// FR: Implémentation du lanceur de processus POSIX.

#include "infrastructure/system/process_runner.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace DRX {

namespace {

// EN: Owns one file descriptor.
// FR: Possède un descripteur de fichier.
class ScopedFd {
public:
    explicit ScopedFd(int fd = -1) : fd_(fd) {}
    ~ScopedFd() { reset(); }

    ScopedFd(const ScopedFd&) = delete;
    ScopedFd& operator=(const ScopedFd&) = delete;

    int get() const { return fd_; }
    explicit operator bool() const { return fd_ >= 0; }

    void reset(int fd = -1) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_;
};

enum ChildFailureStage : int {
    kChildChdirFailed = 1,
    kChildExecFailed = 2
};

struct ChildFailure {
    int stage;
    int error_number;
};

bool makePipe(ScopedFd& read_end, ScopedFd& write_end) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return false;
    }
    read_end.reset(fds[0]);
    write_end.reset(fds[1]);
    return true;
}

void setNonBlocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        (void)::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

// EN: Only async-signal-safe calls between fork and exec.
// FR: Uniquement des appels async-signal-safe entre fork et exec.
[[noreturn]] void reportChildFailure(int fd, int stage) {
    ChildFailure failure{stage, errno};
    ssize_t ignored = ::write(fd, &failure, sizeof(failure));
    (void)ignored;
    ::_exit(127);
}

// EN: Reads everything currently available. Returns false once the pipe is at EOF or broken.
// FR: Lit tout ce qui est disponible. Retourne false une fois le pipe en EOF ou cassé.
bool readAvailable(int fd, std::string& sink) {
    char buffer[4096];
    while (true) {
        ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            sink.append(buffer, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

void killProcessGroup(pid_t pid) {
    (void)::kill(-pid, SIGKILL);
    (void)::kill(pid, SIGKILL);
}

} // namespace

PosixCommandRunner::PosixCommandRunner() {
    // EN: A child closing stdin early must surface as EPIPE, not kill the executor.
    // FR: Un enfant qui ferme stdin tôt doit produire EPIPE, pas tuer l'exécuteur.
    std::signal(SIGPIPE, SIG_IGN);
}

ProcessResult PosixCommandRunner::run(const CommandSpec& spec, const ExecutionOptions& options) {
    ProcessResult result;

    if (spec.argv.empty() || spec.argv[0].empty()) {
        result.error = "empty command";
        return result;
    }
    if (options.isCancelled()) {
        result.cancelled = true;
        result.error = "cancelled before start";
        return result;
    }

    ScopedFd in_read, in_write, out_read, out_write, err_read, err_write, status_read, status_write;
    if (!makePipe(in_read, in_write) || !makePipe(out_read, out_write) ||
        !makePipe(err_read, err_write) || !makePipe(status_read, status_write)) {
        result.error = std::string("pipe failed: ") + std::strerror(errno);
        return result;
    }

    // EN: Everything the child needs is prepared before fork.
    // FR: Tout ce dont l'enfant a besoin est préparé avant fork.
    std::vector<char*> child_argv;
    child_argv.reserve(spec.argv.size() + 1);
    for (const auto& arg : spec.argv) {
        child_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    child_argv.push_back(nullptr);
    const char* child_cwd = spec.working_directory.empty() ? nullptr : spec.working_directory.c_str();

    pid_t pid = ::fork();
    if (pid < 0) {
        result.error = std::string("fork failed: ") + std::strerror(errno);
        return result;
    }

    if (pid == 0) {
        (void)::setpgid(0, 0);
        ::signal(SIGPIPE, SIG_DFL);
        (void)::dup2(in_read.get(), STDIN_FILENO);
        (void)::dup2(out_write.get(), STDOUT_FILENO);
        (void)::dup2(err_write.get(), STDERR_FILENO);
        if (child_cwd != nullptr && ::chdir(child_cwd) != 0) {
            reportChildFailure(status_write.get(), kChildChdirFailed);
        }
        ::execvp(child_argv[0], child_argv.data());
        reportChildFailure(status_write.get(), kChildExecFailed);
    }

    (void)::setpgid(pid, pid);
    in_read.reset();
    out_write.reset();
    err_write.reset();
    status_write.reset();

    // EN: The status pipe closes on a successful exec; bytes mean the child never started.
    // FR: Le pipe de statut se ferme sur un exec réussi ; des octets signifient un échec de démarrage.
    ChildFailure failure{};
    ssize_t n;
    do {
        n = ::read(status_read.get(), &failure, sizeof(failure));
    } while (n < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(failure))) {
        int ignored_status = 0;
        (void)::waitpid(pid, &ignored_status, 0);
        if (failure.stage == kChildChdirFailed) {
            result.error = "chdir " + spec.working_directory + ": " + std::strerror(failure.error_number);
        } else {
            result.error = "exec: \"" + spec.argv[0] + "\": " + std::strerror(failure.error_number);
        }
        return result;
    }

    result.started = true;
    LOG_DEBUG("process", "Started pid " + std::to_string(pid) + ": " + joinCommandLine(spec.argv));

    setNonBlocking(in_write.get());
    setNonBlocking(out_read.get());
    setNonBlocking(err_read.get());

    size_t stdin_offset = 0;
    if (spec.stdin_data.empty()) {
        in_write.reset();
    }

    const auto start = std::chrono::steady_clock::now();
    int wait_status = 0;
    bool reaped = false;

    while (true) {
        std::vector<pollfd> fds;
        if (in_write) fds.push_back({in_write.get(), POLLOUT, 0});
        if (out_read) fds.push_back({out_read.get(), POLLIN, 0});
        if (err_read) fds.push_back({err_read.get(), POLLIN, 0});

        int slice_ms = static_cast<int>(poll_slice_.count());
        if (options.timeout.count() > 0) {
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start);
            auto remaining = options.timeout - elapsed;
            if (remaining.count() < slice_ms) {
                slice_ms = std::max<int>(1, static_cast<int>(remaining.count()));
            }
        }
        (void)::poll(fds.empty() ? nullptr : fds.data(), fds.size(), slice_ms);

        for (const auto& pfd : fds) {
            if (pfd.revents == 0) {
                continue;
            }
            if (in_write && pfd.fd == in_write.get()) {
                if (pfd.revents & (POLLERR | POLLHUP)) {
                    in_write.reset();
                    continue;
                }
                ssize_t written = ::write(in_write.get(), spec.stdin_data.data() + stdin_offset,
                                          spec.stdin_data.size() - stdin_offset);
                if (written > 0) {
                    stdin_offset += static_cast<size_t>(written);
                    if (stdin_offset >= spec.stdin_data.size()) {
                        in_write.reset();
                    }
                } else if (written < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                    // EN: EPIPE: the child stopped reading its input.
                    // FR: EPIPE : l'enfant a cessé de lire son entrée.
                    in_write.reset();
                }
            } else if (out_read && pfd.fd == out_read.get()) {
                if (!readAvailable(out_read.get(), result.stdout_data)) {
                    out_read.reset();
                }
            } else if (err_read && pfd.fd == err_read.get()) {
                if (!readAvailable(err_read.get(), result.stderr_data)) {
                    err_read.reset();
                }
            }
        }

        pid_t waited = ::waitpid(pid, &wait_status, WNOHANG);
        if (waited == pid) {
            reaped = true;
            break;
        }
        if (waited < 0 && errno != EINTR) {
            result.error = std::string("waitpid failed: ") + std::strerror(errno);
            break;
        }

        if (options.isCancelled()) {
            result.cancelled = true;
            LOG_WARN("process", "Cancellation requested, killing pid " + std::to_string(pid));
        } else if (options.timeout.count() > 0 &&
                   std::chrono::steady_clock::now() - start >= options.timeout) {
            result.timed_out = true;
            LOG_WARN("process", "Timeout of " + std::to_string(options.timeout.count()) +
                     "ms reached, killing pid " + std::to_string(pid));
        }
        if (result.cancelled || result.timed_out) {
            killProcessGroup(pid);
            while (::waitpid(pid, &wait_status, 0) < 0 && errno == EINTR) {
            }
            reaped = true;
            break;
        }
    }

    // EN: Collect whatever the child wrote before exiting.
    // FR: Récupère ce que l'enfant a écrit avant de se terminer.
    if (out_read) {
        (void)readAvailable(out_read.get(), result.stdout_data);
    }
    if (err_read) {
        (void)readAvailable(err_read.get(), result.stderr_data);
    }

    if (reaped) {
        if (WIFEXITED(wait_status)) {
            result.exited = true;
            result.exit_code = WEXITSTATUS(wait_status);
        } else if (WIFSIGNALED(wait_status)) {
            result.signaled = true;
            result.term_signal = WTERMSIG(wait_status);
        }
    }

    return result;
}

std::vector<std::string> environmentSnapshot() {
    std::vector<std::string> env;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        env.emplace_back(*entry);
    }
    return env;
}

std::string joinCommandLine(const std::vector<std::string>& argv) {
    std::string line;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) {
            line += ' ';
        }
        line += argv[i];
    }
    return line;
}

} // namespace DRX
