/**
 * @file cancellation.hpp
 * @brief Cooperative cancellation shared by all suspending operations
 *
 * A CancellationSource owns the cancelled flag; CancellationTokens are cheap
 * copies that waiting code polls or sleeps on. A default-constructed token is
 * never cancelled.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace warden {
namespace utils {

namespace detail {

struct CancellationState {
    std::mutex mutex;
    std::condition_variable cv;
    bool cancelled{false};
};

} // namespace detail

/**
 * @class CancellationToken
 * @brief Read side of a cancellation signal
 */
class CancellationToken {
public:
    CancellationToken() = default;

    /**
     * @brief Check whether cancellation was requested
     */
    bool IsCancelled() const;

    /**
     * @brief Sleep for at most @p duration, waking early on cancellation
     * @return true if cancellation was requested
     */
    bool WaitFor(std::chrono::milliseconds duration) const;

    /**
     * @brief Sleep until @p deadline, waking early on cancellation
     * @return true if cancellation was requested
     */
    bool WaitUntil(std::chrono::steady_clock::time_point deadline) const;

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::CancellationState> state_;
};

/**
 * @class CancellationSource
 * @brief Write side of a cancellation signal
 *
 * **Usage Example**:
 * @code
 * utils::CancellationSource source;
 * auto future = std::async(std::launch::async, [&] {
 *     return sandbox.RunCommand(spec, source.Token());
 * });
 * source.Cancel();  // process tree is reaped, OperationCancelled is thrown
 * @endcode
 */
class CancellationSource {
public:
    CancellationSource();

    /**
     * @brief Request cancellation and wake every waiter
     */
    void Cancel();

    bool IsCancelled() const;

    CancellationToken Token() const { return CancellationToken(state_); }

private:
    std::shared_ptr<detail::CancellationState> state_;
};

} // namespace utils
} // namespace warden
