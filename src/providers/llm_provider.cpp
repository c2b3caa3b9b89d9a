#include "providers/llm_provider.hpp"

#include <algorithm>

#include "credentials/credential_pool.hpp"
#include "providers/gemini_provider.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace codetutor::providers {

bool IsQuotaError(int status, const std::string& message) {
    if (status == 429) {
        return true;
    }
    const auto lower = utils::ToLower(message);
    return lower.find("quota") != std::string::npos ||
        lower.find("rate limit") != std::string::npos ||
        lower.find("resource_exhausted") != std::string::npos;
}

ProviderSettings ResolveProviderSettings(const codetutor::config::Config& config) {
    ProviderSettings settings{};
    settings.api_keys = config.advisor.api_keys;
    settings.model = config.advisor.model.empty() ? "gemini-2.5-flash" : config.advisor.model;
    settings.api_base = config.advisor.api_base.empty()
        ? "https://generativelanguage.googleapis.com"
        : config.advisor.api_base;
    settings.timeout_seconds = std::max(config.advisor.timeout_seconds, 1);
    settings.max_attempts = static_cast<std::size_t>(std::max(config.advisor.max_attempts, 1));
    return settings;
}

std::unique_ptr<LLMProvider> CreateProvider(const codetutor::config::Config& config) {
    auto settings = ResolveProviderSettings(config);
    if (settings.api_keys.empty()) {
        utils::LogWarn("advisor", "no API keys configured, AI endpoints are disabled");
        return nullptr;
    }
    auto pool = std::make_shared<credentials::CredentialPool>(std::move(settings.api_keys));
    return std::make_unique<GeminiProvider>(
        std::move(pool),
        settings.api_base,
        settings.model,
        settings.timeout_seconds,
        settings.max_attempts);
}

}  // namespace codetutor::providers
