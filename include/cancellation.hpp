#ifndef CANCELLATION_HPP
#define CANCELLATION_HPP

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace Hookstage {

/**
 * @class CancellationToken
 * @brief One-shot cancellation signal shared between the caller and the
 *        readiness poll loops. A waiting poll loop wakes immediately when
 *        the token is cancelled.
 */
class CancellationToken
{
public:
    /**
     * @brief Marks the token cancelled and wakes every waiter. Idempotent.
     */
    void cancel();

    bool isCancelled() const;

    /**
     * @brief Sleeps for up to `duration` or until the token is cancelled.
     * @return True if the token is cancelled.
     */
    bool waitFor(std::chrono::milliseconds duration) const;

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool cancelled_ = false;
};

} // namespace Hookstage

#endif // CANCELLATION_HPP
