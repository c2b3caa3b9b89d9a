#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include "nlohmann/json.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace codetutor::config {
namespace {

using utils::GetEnv;

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

void ReadString(const nlohmann::json& source, const char* key, std::string& target) {
    if (source.contains(key) && source[key].is_string()) {
        target = source[key].get<std::string>();
    }
}

void ReadInt(const nlohmann::json& source, const char* key, int& target) {
    if (source.contains(key) && source[key].is_number_integer()) {
        target = source[key].get<int>();
    }
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("server") && data["server"].is_object()) {
        const auto& server = data["server"];
        ReadString(server, "host", config.server.host);
        ReadInt(server, "port", config.server.port);
    }

    if (data.contains("sandbox") && data["sandbox"].is_object()) {
        const auto& sandbox = data["sandbox"];
        ReadInt(sandbox, "timeoutSeconds", config.sandbox.timeout_seconds);
        ReadInt(sandbox, "maxOutputChars", config.sandbox.max_output_chars);
        ReadInt(sandbox, "maxCodeChars", config.sandbox.max_code_chars);
        ReadInt(sandbox, "maxInputs", config.sandbox.max_inputs);
        ReadInt(sandbox, "maxInputChars", config.sandbox.max_input_chars);
        ReadInt(sandbox, "maxConcurrentRuns", config.sandbox.max_concurrent_runs);
    }

    if (data.contains("advisor") && data["advisor"].is_object()) {
        const auto& advisor = data["advisor"];
        ReadString(advisor, "model", config.advisor.model);
        ReadString(advisor, "apiBase", config.advisor.api_base);
        ReadInt(advisor, "maxAttempts", config.advisor.max_attempts);
        ReadInt(advisor, "timeoutSeconds", config.advisor.timeout_seconds);
        if (advisor.contains("apiKeys") && advisor["apiKeys"].is_array()) {
            config.advisor.api_keys.clear();
            for (const auto& item : advisor["apiKeys"]) {
                if (item.is_string() && !item.get<std::string>().empty()) {
                    config.advisor.api_keys.push_back(item.get<std::string>());
                }
            }
        }
    }

    if (data.contains("questions") && data["questions"].is_object()) {
        const auto& questions = data["questions"];
        ReadString(questions, "sheetUrl", config.questions.sheet_url);
        ReadString(questions, "fallbackFile", config.questions.fallback_file);
        ReadInt(questions, "cacheMinutes", config.questions.cache_minutes);
    }

    if (data.contains("logging") && data["logging"].is_object()) {
        ReadString(data["logging"], "level", config.logging.level);
    }
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        utils::LogWarn("config", "ignoring non-numeric value '" + value + "'");
        return fallback;
    }
}

std::vector<std::string> SplitCsv(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        item = utils::Trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

void OverrideString(const char* primary, const char* secondary, std::string& target) {
    const auto value = GetEnvFallback(primary, secondary);
    if (!value.empty()) {
        target = value;
    }
}

void OverrideInt(const char* primary, const char* secondary, int& target) {
    const auto value = GetEnvFallback(primary, secondary);
    if (!value.empty()) {
        target = ParseInt(value, target);
    }
}

void ApplyEnvOverrides(Config& config) {
    OverrideString("CODETUTOR_SERVER__HOST", "CODETUTOR_SERVER_HOST", config.server.host);
    OverrideInt("CODETUTOR_SERVER__PORT", "CODETUTOR_SERVER_PORT", config.server.port);

    OverrideInt("CODETUTOR_SANDBOX__TIMEOUT_SECONDS", "CODETUTOR_SANDBOX_TIMEOUT_SECONDS",
                config.sandbox.timeout_seconds);
    OverrideInt("CODETUTOR_SANDBOX__MAX_OUTPUT_CHARS", "CODETUTOR_SANDBOX_MAX_OUTPUT_CHARS",
                config.sandbox.max_output_chars);
    OverrideInt("CODETUTOR_SANDBOX__MAX_CONCURRENT_RUNS", "CODETUTOR_SANDBOX_MAX_CONCURRENT_RUNS",
                config.sandbox.max_concurrent_runs);

    const auto api_keys = GetEnvFallback("CODETUTOR_ADVISOR__API_KEYS", "CODETUTOR_ADVISOR_API_KEYS");
    if (!api_keys.empty()) {
        config.advisor.api_keys = SplitCsv(api_keys);
    }
    // Single key, as most deployments provide it.
    const auto gemini_key = GetEnv("GEMINI_API_KEY");
    if (!gemini_key.empty() && config.advisor.api_keys.empty()) {
        config.advisor.api_keys.push_back(gemini_key);
    }
    OverrideString("CODETUTOR_ADVISOR__MODEL", "CODETUTOR_ADVISOR_MODEL", config.advisor.model);
    OverrideString("CODETUTOR_ADVISOR__API_BASE", "CODETUTOR_ADVISOR_API_BASE", config.advisor.api_base);
    OverrideInt("CODETUTOR_ADVISOR__MAX_ATTEMPTS", "CODETUTOR_ADVISOR_MAX_ATTEMPTS", config.advisor.max_attempts);

    OverrideString("CODETUTOR_QUESTIONS__SHEET_URL", "CODETUTOR_QUESTIONS_SHEET_URL", config.questions.sheet_url);
    OverrideString("CODETUTOR_QUESTIONS__FALLBACK_FILE", "CODETUTOR_QUESTIONS_FALLBACK_FILE",
                   config.questions.fallback_file);
    OverrideInt("CODETUTOR_QUESTIONS__CACHE_MINUTES", "CODETUTOR_QUESTIONS_CACHE_MINUTES",
                config.questions.cache_minutes);

    OverrideString("CODETUTOR_LOGGING__LEVEL", "CODETUTOR_LOG_LEVEL", config.logging.level);
}

void ClampLimits(SandboxConfig& sandbox) {
    sandbox.timeout_seconds = std::max(sandbox.timeout_seconds, 1);
    sandbox.max_output_chars = std::max(sandbox.max_output_chars, 1);
    sandbox.max_concurrent_runs = std::max(sandbox.max_concurrent_runs, 1);
    sandbox.max_code_chars = std::max(sandbox.max_code_chars, 1);
    sandbox.max_inputs = std::max(sandbox.max_inputs, 0);
    sandbox.max_input_chars = std::max(sandbox.max_input_chars, 0);
}

}  // namespace

std::filesystem::path GetConfigPath() {
    const auto explicit_path = GetEnv("CODETUTOR_CONFIG");
    if (!explicit_path.empty()) {
        return explicit_path;
    }
    return GetHomePath() / ".codetutor" / "config.json";
}

Config LoadConfig() {
    return LoadConfig(GetConfigPath());
}

Config LoadConfig(const std::filesystem::path& path) {
    Config config{};

    if (std::filesystem::exists(path)) {
        try {
            std::ifstream input(path);
            nlohmann::json data;
            input >> data;
            ApplyConfigFromJson(config, data);
        } catch (const std::exception& e) {
            utils::LogWarn("config", "keeping defaults, failed to parse " + path.string() + ": " + e.what());
        }
    }

    ApplyEnvOverrides(config);
    ClampLimits(config.sandbox);
    return config;
}

}  // namespace codetutor::config
