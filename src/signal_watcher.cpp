#include "signal_watcher.hpp"
#include "utils.hpp"

#include <cstring>
#include <stdexcept>
#include <string>

namespace Hookstage {

SignalWatcher::SignalWatcher(CancellationToken& token)
{
    sigemptyset(&signals_);
    sigaddset(&signals_, SIGINT);
    sigaddset(&signals_, SIGTERM);
    sigaddset(&signals_, SIGUSR1);

    int rc = pthread_sigmask(SIG_BLOCK, &signals_, &previous_);
    if (rc != 0) {
        throw std::runtime_error(std::string("Could not block signals: ") + std::strerror(rc));
    }

    try {
        thread_ = std::thread([this, &token]() { watch(token); });
    } catch (...) {
        pthread_sigmask(SIG_SETMASK, &previous_, nullptr);
        throw;
    }
}

SignalWatcher::~SignalWatcher()
{
    stopping_ = true;
    pthread_kill(thread_.native_handle(), SIGUSR1);
    thread_.join();
    pthread_sigmask(SIG_SETMASK, &previous_, nullptr);
}

pthread_t SignalWatcher::nativeHandle()
{
    return thread_.native_handle();
}

void SignalWatcher::watch(CancellationToken& token)
{
    while (true) {
        int received = 0;
        int rc = sigwait(&signals_, &received);
        if (rc != 0) {
            log_error("sigwait failed: " + std::string(std::strerror(rc)));
            return;
        }
        if (received == SIGUSR1) {
            if (stopping_) {
                return;
            }
            log_message("Ignoring SIGUSR1");
            continue;
        }
        log_warning("Received signal " + std::to_string(received) + ", cancelling");
        token.cancel();
    }
}

} // namespace Hookstage
