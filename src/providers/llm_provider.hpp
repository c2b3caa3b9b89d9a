#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "config/config_schema.hpp"

namespace codetutor::providers {

struct LLMResponse {
    std::string content;
    std::string finish_reason = "stop";
    // HTTP status of the last attempt, 0 when no request was made.
    int status = 0;
    std::unordered_map<std::string, int> usage;

    bool IsError() const { return finish_reason == "error"; }
};

// Receives streamed text in order. Returning false stops the stream.
using ChunkCallback = std::function<bool(const std::string& text)>;

class LLMProvider {
public:
    virtual ~LLMProvider() = default;

    // One-shot completion. A non-empty `json_schema` asks for a JSON reply
    // matching it. `max_attempts` caps how many credentials are tried; 0
    // keeps the provider's configured limit.
    virtual LLMResponse Generate(const std::string& prompt,
                                 const std::string& json_schema,
                                 std::size_t max_attempts) = 0;

    // Streams the completion through `on_chunk`; the returned response holds
    // the concatenated text.
    virtual LLMResponse Stream(const std::string& prompt, const ChunkCallback& on_chunk) = 0;

    virtual std::string GetDefaultModel() const = 0;
};

struct ProviderSettings {
    std::vector<std::string> api_keys;
    std::string api_base;
    std::string model;
    int timeout_seconds = 60;
    std::size_t max_attempts = 5;
};

// True for HTTP 429 and for quota or rate limit errors reported in the body.
bool IsQuotaError(int status, const std::string& message);

ProviderSettings ResolveProviderSettings(const codetutor::config::Config& config);

// nullptr when no API key is configured.
std::unique_ptr<LLMProvider> CreateProvider(const codetutor::config::Config& config);

}  // namespace codetutor::providers
