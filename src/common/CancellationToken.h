#ifndef CANCELLATIONTOKEN_H
#define CANCELLATIONTOKEN_H

#include <atomic>

// Set from any thread (including a signal handler), observed by the
// controller's blocking waits at poll granularity.
class CancellationToken
{
public:
    void cancel() { cancelled_.store(true); }
    void reset() { cancelled_.store(false); }
    bool isCancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

#endif // CANCELLATIONTOKEN_H
