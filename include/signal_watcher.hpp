#ifndef SIGNAL_WATCHER_HPP
#define SIGNAL_WATCHER_HPP

#include "cancellation.hpp"

#include <atomic>
#include <thread>
#include <pthread.h>
#include <signal.h>

namespace Hookstage {

/**
 * @class SignalWatcher
 * @brief Cancels a token on SIGINT/SIGTERM.
 *
 * The constructor blocks SIGINT, SIGTERM and SIGUSR1 in the calling thread
 * (threads started afterwards inherit the mask) and a dedicated thread
 * consumes them with sigwait(). SIGUSR1 is the internal stop request and is
 * ignored unless the destructor sent it. The destructor restores the mask the
 * calling thread had before, so it must run on the constructing thread.
 */
class SignalWatcher
{
public:
    explicit SignalWatcher(CancellationToken& token);
    ~SignalWatcher();

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

    pthread_t nativeHandle();

private:
    void watch(CancellationToken& token);

    sigset_t signals_;
    sigset_t previous_;
    std::atomic<bool> stopping_{false};
    std::thread thread_;
};

} // namespace Hookstage

#endif // SIGNAL_WATCHER_HPP
