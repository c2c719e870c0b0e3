/// @file process.cpp
/// fork/exec child process with pipes for stdin and stdout.

#include <fenprobe/process.hpp>

#include <fenprobe/errors.hpp>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <mutex>
#include <utility>

namespace fenprobe {

// ── Helpers ─────────────────────────────────────────────────────────────────

namespace {

/// Writing to a child that died must fail with EPIPE, not kill us.
std::once_flag g_sigpipe_flag;
void ignore_sigpipe() {
    std::call_once(g_sigpipe_flag, [] { ::signal(SIGPIPE, SIG_IGN); });
}

void close_fd(int& fd) noexcept {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

/// A pipe whose descriptors are closed on exec; dup2 in the child clears
/// the flag on the copies it installs.
void make_pipe(int fds[2]) {
    if (::pipe(fds) != 0) {
        throw ProcessError(errno, "pipe() failed");
    }
    ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
}

}  // namespace

// ── ExitStatus ──────────────────────────────────────────────────────────────

std::string ExitStatus::to_string() const {
    if (signaled()) {
        return "signal " + std::to_string(signal) + " (" + ::strsignal(signal) + ")";
    }
    return "exit code " + std::to_string(code);
}

ExitStatus ExitStatus::from_wait_status(int status) noexcept {
    ExitStatus s;
    if (WIFEXITED(status)) {
        s.code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        s.signal = WTERMSIG(status);
    }
    return s;
}

// ── Lifetime ────────────────────────────────────────────────────────────────

Process::~Process() {
    release();
}

Process::Process(Process&& other) noexcept
    : pid_(std::exchange(other.pid_, -1)),
      in_fd_(std::exchange(other.in_fd_, -1)),
      out_(std::exchange(other.out_, nullptr)),
      exit_(std::exchange(other.exit_, std::nullopt)) {}

Process& Process::operator=(Process&& other) noexcept {
    if (this != &other) {
        release();
        pid_ = std::exchange(other.pid_, -1);
        in_fd_ = std::exchange(other.in_fd_, -1);
        out_ = std::exchange(other.out_, nullptr);
        exit_ = std::exchange(other.exit_, std::nullopt);
    }
    return *this;
}

void Process::release() noexcept {
    close_fd(in_fd_);
    if (out_) {
        std::fclose(out_);
        out_ = nullptr;
    }
    if (pid_ > 0 && !exit_) {
        ::kill(pid_, SIGKILL);
        int status = 0;
        while (::waitpid(pid_, &status, 0) == -1 && errno == EINTR) {
        }
    }
    pid_ = -1;
    exit_.reset();
}

// ── Spawn ───────────────────────────────────────────────────────────────────

Process Process::spawn(const std::string& path, const std::vector<std::string>& args) {
    ignore_sigpipe();

    // argv is built before fork; the child only calls async-signal-safe functions.
    std::vector<std::string> storage;
    storage.reserve(args.size() + 1);
    storage.push_back(path);
    storage.insert(storage.end(), args.begin(), args.end());
    std::vector<char*> argv;
    argv.reserve(storage.size() + 1);
    for (auto& s : storage) argv.push_back(s.data());
    argv.push_back(nullptr);

    int inpipe[2]{-1, -1};
    int outpipe[2]{-1, -1};
    int errpipe[2]{-1, -1};  // reports exec failure back to the parent
    try {
        make_pipe(inpipe);
        make_pipe(outpipe);
        make_pipe(errpipe);
    } catch (...) {
        for (int* fd : {&inpipe[0], &inpipe[1], &outpipe[0], &outpipe[1], &errpipe[0],
                        &errpipe[1]})
            close_fd(*fd);
        throw;
    }

    pid_t pid = ::fork();
    if (pid == -1) {
        int err = errno;
        for (int* fd : {&inpipe[0], &inpipe[1], &outpipe[0], &outpipe[1], &errpipe[0],
                        &errpipe[1]})
            close_fd(*fd);
        throw ProcessError(err, "fork() failed");
    }

    if (pid == 0) {
        ::dup2(inpipe[0], STDIN_FILENO);
        ::dup2(outpipe[1], STDOUT_FILENO);
        ::dup2(outpipe[1], STDERR_FILENO);
        ::execv(path.c_str(), argv.data());
        int err = errno;
        ssize_t ignored = ::write(errpipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    close_fd(inpipe[0]);
    close_fd(outpipe[1]);
    close_fd(errpipe[1]);

    // exec closes errpipe; any data means it failed.
    int exec_errno = 0;
    ssize_t n = 0;
    do {
        n = ::read(errpipe[0], &exec_errno, sizeof(exec_errno));
    } while (n == -1 && errno == EINTR);
    close_fd(errpipe[0]);

    Process proc(pid, inpipe[1], nullptr);
    if (n > 0) {
        close_fd(outpipe[0]);
        proc.wait();
        throw ProcessError(exec_errno, "Cannot execute '" + path + "'");
    }

    proc.out_ = ::fdopen(outpipe[0], "r");
    if (!proc.out_) {
        int err = errno;
        close_fd(outpipe[0]);
        throw ProcessError(err, "fdopen() failed");
    }
    return proc;
}

// ── I/O ─────────────────────────────────────────────────────────────────────

bool Process::write_line(std::string_view line) {
    if (in_fd_ < 0) {
        return false;
    }
    std::string buf;
    buf.reserve(line.size() + 1);
    buf.append(line);
    buf += '\n';

    const char* p = buf.data();
    std::size_t left = buf.size();
    while (left > 0) {
        ssize_t n = ::write(in_fd_, p, left);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            if (errno == EPIPE)
                return false;
            throw ProcessError(errno, "write to child failed");
        }
        p += n;
        left -= static_cast<std::size_t>(n);
    }
    return true;
}

std::optional<std::string> Process::read_line() {
    if (!out_) {
        return std::nullopt;
    }
    std::string line;
    for (;;) {
        int ch = std::fgetc(out_);
        if (ch == EOF) {
            if (!std::ferror(out_))
                break;
            int err = errno;
            std::clearerr(out_);
            if (err == EINTR)
                continue;
            throw ProcessError(err, "read from child failed");
        }
        if (ch == '\n')
            return line;
        line.push_back(static_cast<char>(ch));
    }
    // A final unterminated line still counts.
    if (!line.empty())
        return line;
    return std::nullopt;
}

// ── Exit ────────────────────────────────────────────────────────────────────

std::optional<ExitStatus> Process::poll() {
    if (exit_ || pid_ <= 0) {
        return exit_;
    }
    int status = 0;
    pid_t r = ::waitpid(pid_, &status, WNOHANG);
    if (r == -1) {
        throw ProcessError(errno, "waitpid() failed");
    }
    if (r == pid_) {
        exit_ = ExitStatus::from_wait_status(status);
    }
    return exit_;
}

ExitStatus Process::wait() {
    if (exit_) {
        return *exit_;
    }
    if (pid_ <= 0) {
        throw ProcessError(ECHILD, "wait() on a process that was never started");
    }
    int status = 0;
    pid_t r = 0;
    do {
        r = ::waitpid(pid_, &status, 0);
    } while (r == -1 && errno == EINTR);
    if (r == -1) {
        throw ProcessError(errno, "waitpid() failed");
    }
    exit_ = ExitStatus::from_wait_status(status);
    return *exit_;
}

void Process::close_input() noexcept {
    close_fd(in_fd_);
}

}  // namespace fenprobe
