#include "credentials/credential_pool.hpp"

#include <algorithm>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace codetutor::credentials {

CredentialPool::CredentialPool(std::vector<std::string> credentials)
    : credentials_(std::move(credentials)) {
    utils::LogInfo("credentials", "loaded " + std::to_string(credentials_.size()) + " credential(s)");
}

std::optional<std::string> CredentialPool::Acquire() {
    if (credentials_.empty()) {
        return std::nullopt;
    }
    std::size_t index = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        index = next_;
        next_ = (next_ + 1) % credentials_.size();
    }
    return credentials_[index];
}

AcquireResult CredentialPool::AcquireWithRetry(std::size_t max_attempts, const Attempt& try_credential) {
    AcquireResult result;
    if (credentials_.empty()) {
        result.error = "no credentials configured";
        return result;
    }
    const auto limit = std::min(std::max<std::size_t>(max_attempts, 1), credentials_.size());
    std::size_t start = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        start = next_;
        next_ = (next_ + 1) % credentials_.size();
    }
    for (std::size_t attempt = 0; attempt < limit; ++attempt) {
        const auto& credential = credentials_[(start + attempt) % credentials_.size()];
        ++result.attempts;
        const auto outcome = try_credential(credential);
        if (outcome == AttemptOutcome::kSuccess) {
            result.ok = true;
            result.credential = credential;
            return result;
        }
        if (outcome == AttemptOutcome::kAbort) {
            utils::LogWarn("credentials", "request failed with credential " + utils::MaskKey(credential));
            result.error = "request failed";
            return result;
        }
        utils::LogWarn("credentials", "credential " + utils::MaskKey(credential) +
                       " is rate limited, trying the next one");
    }
    result.error = "all credentials exhausted after " + std::to_string(result.attempts) + " attempt(s)";
    return result;
}

}  // namespace codetutor::credentials
