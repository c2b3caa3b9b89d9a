#include "providers/gemini_provider.hpp"

#include <algorithm>

#include "httplib.h"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace codetutor::providers {
namespace {

struct ParsedUrl {
    bool https = true;
    std::string host;
    int port = 443;
    std::string base_path;
};

ParsedUrl ParseUrl(const std::string& url) {
    ParsedUrl parsed{};
    std::string working = url;
    if (working.rfind("https://", 0) == 0) {
        parsed.https = true;
        working = working.substr(8);
    } else if (working.rfind("http://", 0) == 0) {
        parsed.https = false;
        parsed.port = 80;
        working = working.substr(7);
    }

    const auto slash_pos = working.find('/');
    std::string host_port = working;
    if (slash_pos != std::string::npos) {
        host_port = working.substr(0, slash_pos);
        parsed.base_path = working.substr(slash_pos);
    }

    const auto colon_pos = host_port.find(':');
    if (colon_pos != std::string::npos) {
        parsed.host = host_port.substr(0, colon_pos);
        parsed.port = std::stoi(host_port.substr(colon_pos + 1));
    } else {
        parsed.host = host_port;
    }

    if (!parsed.base_path.empty() && parsed.base_path.back() == '/') {
        parsed.base_path.pop_back();
    }
    return parsed;
}

bool ParseProxyHostPort(const std::string& proxy, std::string& host, int& port) {
    if (proxy.empty()) {
        return false;
    }
    std::string working = proxy;
    const auto scheme_pos = working.find("://");
    if (scheme_pos != std::string::npos) {
        working = working.substr(scheme_pos + 3);
    }
    const auto slash_pos = working.find('/');
    if (slash_pos != std::string::npos) {
        working = working.substr(0, slash_pos);
    }
    const auto colon_pos = working.rfind(':');
    if (colon_pos == std::string::npos) {
        return false;
    }
    host = working.substr(0, colon_pos);
    try {
        port = std::stoi(working.substr(colon_pos + 1));
    } catch (const std::exception&) {
        return false;
    }
    return !host.empty() && port > 0;
}

std::unique_ptr<httplib::Client> MakeClient(const ParsedUrl& url, int timeout_seconds) {
    std::string scheme_host_port = url.https ? "https://" : "http://";
    scheme_host_port += url.host + ":" + std::to_string(url.port);
    auto client = std::make_unique<httplib::Client>(scheme_host_port);
    client->set_connection_timeout(timeout_seconds);
    client->set_read_timeout(timeout_seconds);

    std::string proxy_host;
    int proxy_port = 0;
    for (const auto* name : {"HTTPS_PROXY", "https_proxy", "HTTP_PROXY", "http_proxy"}) {
        if (ParseProxyHostPort(utils::GetEnv(name), proxy_host, proxy_port)) {
            client->set_proxy(proxy_host, proxy_port);
            break;
        }
    }
    return client;
}

httplib::Headers MakeHeaders(const std::string& api_key) {
    return httplib::Headers{{"x-goog-api-key", api_key}};
}

LLMResponse ErrorResponse(int status, const std::string& message) {
    LLMResponse response;
    response.status = status;
    response.finish_reason = "error";
    response.content = message;
    return response;
}

// "HTTP 429: <error.message>" from a Google API error body.
std::string DescribeHttpError(int status, const std::string& body) {
    std::string message = "Error calling LLM: HTTP " + std::to_string(status);
    const auto json = nlohmann::json::parse(body, nullptr, false);
    if (!json.is_discarded() && json.contains("error") && json["error"].is_object()) {
        const auto& error = json["error"];
        if (error.contains("message") && error["message"].is_string()) {
            message += ": " + error["message"].get<std::string>();
        }
        if (error.contains("status") && error["status"].is_string()) {
            message += " (" + error["status"].get<std::string>() + ")";
        }
    }
    return message;
}

credentials::AttemptOutcome Classify(const LLMResponse& response) {
    if (!response.IsError()) {
        return credentials::AttemptOutcome::kSuccess;
    }
    return IsQuotaError(response.status, response.content)
        ? credentials::AttemptOutcome::kRetryNext
        : credentials::AttemptOutcome::kAbort;
}

}  // namespace

GeminiProvider::GeminiProvider(std::shared_ptr<credentials::CredentialPool> credentials,
                               std::string api_base,
                               std::string default_model,
                               int timeout_seconds,
                               std::size_t max_attempts)
    : credentials_(std::move(credentials))
    , api_base_(std::move(api_base))
    , default_model_(std::move(default_model))
    , timeout_seconds_(timeout_seconds)
    , max_attempts_(max_attempts) {}

nlohmann::json GeminiProvider::BuildPayload(const std::string& prompt, const std::string& json_schema) {
    nlohmann::json payload;
    payload["contents"] = nlohmann::json::array({{
        {"role", "user"},
        {"parts", nlohmann::json::array({{{"text", prompt}}})}
    }});
    if (!json_schema.empty()) {
        auto schema = nlohmann::json::parse(json_schema, nullptr, false);
        payload["generationConfig"] = {{"responseMimeType", "application/json"}};
        if (!schema.is_discarded()) {
            payload["generationConfig"]["responseSchema"] = schema;
        }
    }
    return payload;
}

LLMResponse GeminiProvider::ParseResponse(const std::string& body) {
    auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return ErrorResponse(0, "Error calling LLM: invalid response");
    }
    if (json.contains("error") && json["error"].is_object()) {
        const int code = json["error"].value("code", 0);
        return ErrorResponse(code, DescribeHttpError(code, body));
    }

    LLMResponse parsed{};
    if (json.contains("candidates") && json["candidates"].is_array() && !json["candidates"].empty()) {
        const auto& candidate = json["candidates"][0];
        if (candidate.contains("content") && candidate["content"].contains("parts")) {
            for (const auto& part : candidate["content"]["parts"]) {
                if (part.contains("text") && part["text"].is_string()) {
                    parsed.content += part["text"].get<std::string>();
                }
            }
        }
        if (candidate.contains("finishReason") && candidate["finishReason"].is_string()) {
            parsed.finish_reason = utils::ToLower(candidate["finishReason"].get<std::string>());
        }
    }
    if (json.contains("usageMetadata") && json["usageMetadata"].is_object()) {
        const auto& usage = json["usageMetadata"];
        if (usage.contains("promptTokenCount")) {
            parsed.usage["prompt_tokens"] = usage["promptTokenCount"].get<int>();
        }
        if (usage.contains("candidatesTokenCount")) {
            parsed.usage["completion_tokens"] = usage["candidatesTokenCount"].get<int>();
        }
        if (usage.contains("totalTokenCount")) {
            parsed.usage["total_tokens"] = usage["totalTokenCount"].get<int>();
        }
    }
    return parsed;
}

std::vector<std::string> GeminiProvider::DrainSseEvents(std::string& buffer) {
    buffer.erase(std::remove(buffer.begin(), buffer.end(), '\r'), buffer.end());
    std::vector<std::string> events;
    std::size_t end = 0;
    while ((end = buffer.find("\n\n")) != std::string::npos) {
        const auto block = buffer.substr(0, end);
        buffer.erase(0, end + 2);
        std::string data;
        std::size_t start = 0;
        while (start <= block.size()) {
            auto newline = block.find('\n', start);
            if (newline == std::string::npos) {
                newline = block.size();
            }
            const auto line = block.substr(start, newline - start);
            if (line.rfind("data:", 0) == 0) {
                auto value = line.substr(5);
                if (!value.empty() && value.front() == ' ') {
                    value.erase(0, 1);
                }
                if (!data.empty()) {
                    data += "\n";
                }
                data += value;
            }
            start = newline + 1;
        }
        if (!data.empty()) {
            events.push_back(std::move(data));
        }
    }
    return events;
}

std::string GeminiProvider::Endpoint(const std::string& method) const {
    const auto url = ParseUrl(api_base_);
    return url.base_path + "/v1beta/models/" + default_model_ + ":" + method;
}

LLMResponse GeminiProvider::PostOnce(const std::string& endpoint,
                                     const std::string& payload,
                                     const std::string& api_key) const {
    const auto url = ParseUrl(api_base_);
    auto client = MakeClient(url, timeout_seconds_);
    utils::LogDebug("advisor", "POST " + url.host + endpoint + " model=" + default_model_ +
                    " api_key=" + utils::MaskKey(api_key));

    auto response = client->Post(endpoint, MakeHeaders(api_key), payload, "application/json");
    if (!response) {
        const auto err = response.error();
        utils::LogWarn("advisor", "request failed: httplib error=" + httplib::to_string(err));
        return ErrorResponse(0, "Error calling LLM: request failed (" + httplib::to_string(err) + ")");
    }
    if (response->status >= 400) {
        utils::LogWarn("advisor", "HTTP " + std::to_string(response->status) + " from " + url.host);
        return ErrorResponse(response->status, DescribeHttpError(response->status, response->body));
    }
    auto parsed = ParseResponse(response->body);
    parsed.status = response->status;
    return parsed;
}

LLMResponse GeminiProvider::StreamOnce(const std::string& endpoint,
                                       const std::string& payload,
                                       const std::string& api_key,
                                       const ChunkCallback& on_chunk,
                                       bool& emitted) const {
    const auto url = ParseUrl(api_base_);
    auto client = MakeClient(url, timeout_seconds_);
    utils::LogDebug("advisor", "POST (stream) " + url.host + endpoint + " api_key=" + utils::MaskKey(api_key));

    int status = 0;
    bool stopped = false;
    std::string buffer;
    std::string error_body;
    LLMResponse collected;

    httplib::Request request;
    request.method = "POST";
    request.path = endpoint;
    request.headers = MakeHeaders(api_key);
    request.set_header("Content-Type", "application/json");
    request.body = payload;
    request.response_handler = [&status](const httplib::Response& response) {
        status = response.status;
        return true;
    };
    request.content_receiver = [&](const char* data, std::size_t length, std::uint64_t, std::uint64_t) {
        if (status >= 400) {
            error_body.append(data, length);
            return true;
        }
        buffer.append(data, length);
        for (const auto& event : DrainSseEvents(buffer)) {
            const auto chunk = ParseResponse(event);
            if (chunk.IsError() || chunk.content.empty()) {
                continue;
            }
            collected.content += chunk.content;
            emitted = true;
            if (!on_chunk(chunk.content)) {
                stopped = true;
                return false;
            }
        }
        return true;
    };

    httplib::Response response;
    httplib::Error error = httplib::Error::Success;
    const bool sent = client->send(request, response, error);
    if (status >= 400) {
        utils::LogWarn("advisor", "HTTP " + std::to_string(status) + " from " + url.host + " (stream)");
        return ErrorResponse(status, DescribeHttpError(status, error_body));
    }
    if (!sent && !stopped) {
        return ErrorResponse(0, "Error calling LLM: request failed (" + httplib::to_string(error) + ")");
    }
    collected.status = status;
    return collected;
}

LLMResponse GeminiProvider::Generate(const std::string& prompt,
                                     const std::string& json_schema,
                                     std::size_t max_attempts) {
    try {
        const auto payload = BuildPayload(prompt, json_schema).dump();
        const auto endpoint = Endpoint("generateContent");
        const auto attempts = max_attempts == 0 ? max_attempts_ : std::min(max_attempts, max_attempts_);
        LLMResponse last;
        const auto acquired = credentials_->AcquireWithRetry(attempts, [&](const std::string& key) {
            last = PostOnce(endpoint, payload, key);
            return Classify(last);
        });
        if (!acquired.ok && IsQuotaError(last.status, last.content)) {
            return ErrorResponse(429, "Error calling LLM: " + acquired.error + " (quota exceeded, try again later)");
        }
        return last;
    } catch (const std::exception& ex) {
        return ErrorResponse(0, std::string("Error calling LLM: ") + ex.what());
    }
}

LLMResponse GeminiProvider::Stream(const std::string& prompt, const ChunkCallback& on_chunk) {
    try {
        const auto payload = BuildPayload(prompt, "").dump();
        const auto endpoint = Endpoint("streamGenerateContent") + "?alt=sse";
        LLMResponse last;
        bool emitted = false;
        const auto acquired = credentials_->AcquireWithRetry(max_attempts_, [&](const std::string& key) {
            last = StreamOnce(endpoint, payload, key, on_chunk, emitted);
            // Once text reached the caller, a retry would repeat it.
            if (emitted && last.IsError()) {
                return credentials::AttemptOutcome::kAbort;
            }
            return Classify(last);
        });
        if (!acquired.ok && IsQuotaError(last.status, last.content)) {
            return ErrorResponse(429, "Error calling LLM: " + acquired.error + " (quota exceeded, try again later)");
        }
        return last;
    } catch (const std::exception& ex) {
        return ErrorResponse(0, std::string("Error calling LLM: ") + ex.what());
    }
}

}  // namespace codetutor::providers
