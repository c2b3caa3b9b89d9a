#pragma once

#include <atomic>
#include <memory>

namespace codetutor::sandbox {

// Shared flag between a run's supervisor and the worker executing it.
// Copies observe the same flag.
class CancellationToken {
public:
    CancellationToken()
        : cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

    void Cancel() const { cancelled_->store(true, std::memory_order_release); }
    bool IsCancelled() const { return cancelled_->load(std::memory_order_acquire); }

private:
    std::shared_ptr<std::atomic<bool>> cancelled_;
};

}  // namespace codetutor::sandbox
