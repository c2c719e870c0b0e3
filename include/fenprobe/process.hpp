#pragma once

/// @file process.hpp
/// Child process connected through a pair of pipes (POSIX).
///
/// The child's stdin receives lines written with write_line(); its stdout
/// and stderr are merged and read back line by line. All reads block
/// without a timeout.

#include <sys/types.h>

#include <cstdio>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fenprobe {

/// How a child process ended.
struct ExitStatus {
    int code = 0;    ///< Exit code when the child exited normally.
    int signal = 0;  ///< Terminating signal, 0 if the child exited normally.

    [[nodiscard]] bool signaled() const noexcept { return signal != 0; }
    [[nodiscard]] bool success() const noexcept { return signal == 0 && code == 0; }

    /// "exit code 0" / "signal 11 (Segmentation fault)"
    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] static ExitStatus from_wait_status(int status) noexcept;
};

/// Owns one child process and both pipe ends. Move-only.
///
/// Destruction closes the pipes and, if the child has not been reaped yet,
/// kills and reaps it.
class Process {
   public:
    Process() noexcept = default;
    ~Process();

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;
    Process(Process&& other) noexcept;
    Process& operator=(Process&& other) noexcept;

    /// Launch `path` with `args` (argv[0] is `path`). Throws ProcessError if
    /// the pipes cannot be created, fork fails or the program cannot be executed.
    [[nodiscard]] static Process spawn(const std::string& path,
                                       const std::vector<std::string>& args = {});

    [[nodiscard]] bool valid() const noexcept { return pid_ > 0; }
    [[nodiscard]] pid_t pid() const noexcept { return pid_; }

    /// Write `line` plus '\n'. Returns false if the child no longer reads its
    /// stdin (EPIPE). Other failures throw ProcessError.
    [[nodiscard]] bool write_line(std::string_view line);

    /// Read one line without its terminator. std::nullopt on end of stream.
    [[nodiscard]] std::optional<std::string> read_line();

    /// Non-blocking check for exit. Reaps the child when it has exited.
    [[nodiscard]] std::optional<ExitStatus> poll();

    /// Block until the child exits and reap it. Idempotent.
    ExitStatus wait();

    /// Close the child's stdin.
    void close_input() noexcept;

   private:
    Process(pid_t pid, int in_fd, std::FILE* out) noexcept
        : pid_(pid), in_fd_(in_fd), out_(out) {}

    void release() noexcept;

    pid_t pid_ = -1;
    int in_fd_ = -1;          ///< Write end of the child's stdin.
    std::FILE* out_ = nullptr;  ///< Read end of the child's stdout/stderr.
    std::optional<ExitStatus> exit_;
};

}  // namespace fenprobe
