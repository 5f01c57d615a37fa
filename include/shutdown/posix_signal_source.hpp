#pragma once

#include "shutdown/isignal_source.hpp"

#include <csignal>
#include <string>
#include <string_view>
#include <vector>

namespace streamgate {

/**
 * @brief ISignalSource backed by POSIX signals (self-pipe)
 *
 * The installed handler only write()s the signal number into a non-blocking
 * pipe; wait() poll()s that pipe together with a wake pipe that a
 * std::stop_callback writes to, so waiting never polls on a timer.
 *
 * Construct before spawning other threads. One instance per process at a time.
 * Previous dispositions are restored on destruction.
 */
class PosixSignalSource : public ISignalSource {
public:
    /// @throws std::logic_error if another instance is installed
    /// @throws std::runtime_error if pipe() or sigaction() fails
    explicit PosixSignalSource(std::vector<int> signals = {SIGINT, SIGTERM});
    ~PosixSignalSource() override;

    PosixSignalSource(const PosixSignalSource&) = delete;
    PosixSignalSource& operator=(const PosixSignalSource&) = delete;

    [[nodiscard]] std::optional<int> wait(std::stop_token stop) override;

    [[nodiscard]] const std::vector<int>& signals() const { return signals_; }

private:
    void restore();

    std::vector<int> signals_;
    std::vector<struct sigaction> previous_;
    int signal_pipe_[2] = {-1, -1};
    int wake_pipe_[2] = {-1, -1};
};

/// "SIGTERM", "term", "sigint", ... -> signal number
/// @throws std::invalid_argument for unsupported names
[[nodiscard]] int signal_from_name(std::string_view name);

/// SIGTERM -> "SIGTERM"; unknown numbers render as "signal <n>"
[[nodiscard]] std::string signal_to_name(int signo);

} // namespace streamgate
