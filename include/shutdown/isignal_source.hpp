#pragma once

#include <optional>
#include <stop_token>

namespace streamgate {

/**
 * @brief Abstract source of external shutdown requests
 *
 * Implemented over POSIX signals by PosixSignalSource.
 */
class ISignalSource {
public:
    virtual ~ISignalSource() = default;

    /**
     * @brief Block until the next shutdown request or until stop is requested
     * @return Signal number of the request, std::nullopt if the wait was cancelled
     */
    [[nodiscard]] virtual std::optional<int> wait(std::stop_token stop) = 0;
};

} // namespace streamgate
