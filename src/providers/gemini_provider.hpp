#pragma once

#include <memory>
#include <string>
#include <vector>

#include "credentials/credential_pool.hpp"
#include "nlohmann/json.hpp"
#include "providers/llm_provider.hpp"

namespace codetutor::providers {

// Google Generative Language API (generateContent and its SSE streaming
// variant). Every request rotates through the credential pool, moving on to
// the next key when one is rate limited.
class GeminiProvider : public LLMProvider {
public:
    GeminiProvider(std::shared_ptr<credentials::CredentialPool> credentials,
                   std::string api_base,
                   std::string default_model,
                   int timeout_seconds,
                   std::size_t max_attempts);

    LLMResponse Generate(const std::string& prompt,
                         const std::string& json_schema,
                         std::size_t max_attempts) override;
    LLMResponse Stream(const std::string& prompt, const ChunkCallback& on_chunk) override;

    std::string GetDefaultModel() const override { return default_model_; }

    static nlohmann::json BuildPayload(const std::string& prompt, const std::string& json_schema);

    // Parses a generateContent reply (or one streamed event).
    static LLMResponse ParseResponse(const std::string& body);

    // Removes every complete SSE event from `buffer` and returns the data
    // payloads; a trailing partial event stays in the buffer.
    static std::vector<std::string> DrainSseEvents(std::string& buffer);

private:
    std::shared_ptr<credentials::CredentialPool> credentials_;
    std::string api_base_;
    std::string default_model_;
    int timeout_seconds_ = 60;
    std::size_t max_attempts_ = 5;

    std::string Endpoint(const std::string& method) const;
    LLMResponse PostOnce(const std::string& endpoint, const std::string& payload, const std::string& api_key) const;
    LLMResponse StreamOnce(const std::string& endpoint,
                           const std::string& payload,
                           const std::string& api_key,
                           const ChunkCallback& on_chunk,
                           bool& emitted) const;
};

}  // namespace codetutor::providers
