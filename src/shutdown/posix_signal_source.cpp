#include "shutdown/posix_signal_source.hpp"
#include "core/utils.hpp"

#include <atomic>
#include <array>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <poll.h>
#include <stdexcept>
#include <unistd.h>
#include <utility>

namespace streamgate {

namespace {

std::atomic<bool> g_installed{false};
std::atomic<int> g_signal_write_fd{-1};

extern "C" void forward_signal(int signo) {
    const int saved_errno = errno;
    const int fd = g_signal_write_fd.load(std::memory_order_relaxed);
    if (fd >= 0) {
        const auto byte = static_cast<unsigned char>(signo);
        [[maybe_unused]] const auto written = ::write(fd, &byte, 1);
    }
    errno = saved_errno;
}

constexpr std::array<std::pair<std::string_view, int>, 6> kSignalNames{{
    {"SIGINT",  SIGINT},
    {"SIGTERM", SIGTERM},
    {"SIGHUP",  SIGHUP},
    {"SIGQUIT", SIGQUIT},
    {"SIGUSR1", SIGUSR1},
    {"SIGUSR2", SIGUSR2},
}};

void close_pipe(int (&fds)[2]) {
    for (int& fd : fds) {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }
}

void drain_pipe(int fd) {
    unsigned char buf[64];
    while (::read(fd, buf, sizeof(buf)) > 0) {}
}

} // anonymous namespace

PosixSignalSource::PosixSignalSource(std::vector<int> signals)
    : signals_(std::move(signals)) {
    if (g_installed.exchange(true)) {
        throw std::logic_error("A PosixSignalSource is already installed in this process");
    }

    if (::pipe2(signal_pipe_, O_CLOEXEC | O_NONBLOCK) < 0 ||
        ::pipe2(wake_pipe_, O_CLOEXEC | O_NONBLOCK) < 0) {
        const std::string reason = strerror(errno);
        close_pipe(signal_pipe_);
        close_pipe(wake_pipe_);
        g_installed.store(false);
        throw std::runtime_error(std::format("Signal source: pipe2() failed: {}", reason));
    }
    g_signal_write_fd.store(signal_pipe_[1]);

    struct sigaction action{};
    action.sa_handler = forward_signal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;

    previous_.reserve(signals_.size());
    for (const int signo : signals_) {
        struct sigaction old{};
        if (::sigaction(signo, &action, &old) < 0) {
            const std::string reason = strerror(errno);
            restore();
            throw std::runtime_error(std::format("Signal source: sigaction({}) failed: {}",
                signal_to_name(signo), reason));
        }
        previous_.push_back(old);
    }

    std::string names;
    for (const int signo : signals_) {
        if (!names.empty()) names += ", ";
        names += signal_to_name(signo);
    }
    utils::log::debug(std::format("Signal source: handling {}", names));
}

PosixSignalSource::~PosixSignalSource() {
    restore();
}

void PosixSignalSource::restore() {
    for (size_t i = 0; i < previous_.size(); ++i) {
        ::sigaction(signals_[i], &previous_[i], nullptr);
    }
    previous_.clear();
    g_signal_write_fd.store(-1);
    close_pipe(signal_pipe_);
    close_pipe(wake_pipe_);
    g_installed.store(false);
}

std::optional<int> PosixSignalSource::wait(std::stop_token stop) {
    const int wake_fd = wake_pipe_[1];
    std::stop_callback wake(stop, [wake_fd] {
        const char byte = 0;
        [[maybe_unused]] const auto written = ::write(wake_fd, &byte, 1);
    });

    while (!stop.stop_requested()) {
        struct pollfd fds[2] = {
            {signal_pipe_[0], POLLIN, 0},
            {wake_pipe_[0], POLLIN, 0},
        };
        if (::poll(fds, 2, -1) < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error(std::format("Signal source: poll() failed: {}",
                                                 strerror(errno)));
        }

        if (fds[0].revents & POLLIN) {
            unsigned char byte = 0;
            if (::read(signal_pipe_[0], &byte, 1) == 1) {
                return static_cast<int>(byte);
            }
        }
        if (fds[1].revents & POLLIN) {
            drain_pipe(wake_pipe_[0]);
        }
    }
    return std::nullopt;
}

int signal_from_name(std::string_view name) {
    std::string upper = utils::to_upper(utils::trim(name));
    if (!upper.starts_with("SIG")) {
        upper.insert(0, "SIG");
    }
    for (const auto& [sig_name, signo] : kSignalNames) {
        if (sig_name == upper) return signo;
    }
    throw std::invalid_argument(std::format("Unsupported signal name: '{}'", name));
}

std::string signal_to_name(int signo) {
    for (const auto& [sig_name, number] : kSignalNames) {
        if (number == signo) return std::string(sig_name);
    }
    return std::format("signal {}", signo);
}

} // namespace streamgate
