#pragma once

#include <atomic>
#include <memory>

namespace chatvault::transfer {

// Cooperative cancellation flag, checked between chunk operations.
class CancellationToken {
public:
    CancellationToken() : cancelled_(false) {}

    void cancel() { cancelled_.store(true); }
    bool is_cancelled() const { return cancelled_.load(); }
    void reset() { cancelled_.store(false); }

    static std::shared_ptr<CancellationToken> create() {
        return std::make_shared<CancellationToken>();
    }

private:
    std::atomic<bool> cancelled_;
};

}
