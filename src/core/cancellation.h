#pragma once

#include <atomic>

namespace nanoflow::core {

// Set from a signal handler, polled by the runner and the retry backoff
class CancellationToken {
public:
    void request() noexcept { requested_.store(true); }
    bool requested() const noexcept { return requested_.load(); }
    void reset() noexcept { requested_.store(false); }

private:
    std::atomic<bool> requested_{false};
};

} // namespace nanoflow::core
