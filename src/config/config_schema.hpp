#pragma once

#include <string>
#include <vector>

namespace codetutor::config {

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 5000;
};

struct SandboxConfig {
    int timeout_seconds = 5;
    int max_output_chars = 10000;
    int max_code_chars = 50000;
    int max_inputs = 100;
    int max_input_chars = 1000;
    int max_concurrent_runs = 8;
};

struct AdvisorConfig {
    std::string model = "gemini-2.5-flash";
    std::string api_base = "https://generativelanguage.googleapis.com";
    std::vector<std::string> api_keys;
    int max_attempts = 5;
    int timeout_seconds = 60;
};

struct QuestionsConfig {
    std::string sheet_url;
    std::string fallback_file = "questions.json";
    int cache_minutes = 30;
};

struct LoggingConfig {
    std::string level = "info";
};

struct Config {
    ServerConfig server;
    SandboxConfig sandbox;
    AdvisorConfig advisor;
    QuestionsConfig questions;
    LoggingConfig logging;
};

}  // namespace codetutor::config
