#pragma once

#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace codetutor::credentials {

enum class AttemptOutcome {
    kSuccess,
    // Quota or rate limit on this credential; move on to the next one.
    kRetryNext,
    // Fails regardless of credential.
    kAbort
};

struct AcquireResult {
    bool ok = false;
    std::string credential;
    std::size_t attempts = 0;
    std::string error;
};

// Round robin over a fixed set of API credentials. Only the index advance is
// serialized; attempts (network calls) run outside the lock.
class CredentialPool {
public:
    using Attempt = std::function<AttemptOutcome(const std::string& credential)>;

    explicit CredentialPool(std::vector<std::string> credentials);

    CredentialPool(const CredentialPool&) = delete;
    CredentialPool& operator=(const CredentialPool&) = delete;

    std::optional<std::string> Acquire();

    // Tries up to `max_attempts` distinct credentials, clamped to the pool
    // size, and returns the first one whose attempt succeeds.
    AcquireResult AcquireWithRetry(std::size_t max_attempts, const Attempt& try_credential);

    std::size_t Size() const { return credentials_.size(); }
    bool Empty() const { return credentials_.empty(); }

private:
    const std::vector<std::string> credentials_;
    std::size_t next_ = 0;
    std::mutex mutex_;
};

}  // namespace codetutor::credentials
