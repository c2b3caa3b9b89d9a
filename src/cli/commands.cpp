#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "advisor/code_advisor.hpp"
#include "config/config_loader.hpp"
#include "providers/llm_provider.hpp"
#include "questions/question_repository.hpp"
#include "sandbox/sandbox_executor.hpp"
#include "server/api_server.hpp"
#include "utils/logging.hpp"

namespace {

volatile std::sig_atomic_t g_signal = 0;

void HandleSignal(int signal) {
    g_signal = signal;
}

void ApplyLogging(const codetutor::config::Config& config) {
    codetutor::utils::LogConfig log_config;
    log_config.min_level = codetutor::utils::ParseLogLevel(config.logging.level, codetutor::utils::LogLevel::kInfo);
    codetutor::utils::ApplyLogConfig(log_config);
}

bool ReadSource(const std::string& path, std::string& source) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return false;
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    source = buffer.str();
    return true;
}

int RunServe() {
    auto config = codetutor::config::LoadConfig();
    ApplyLogging(config);

    codetutor::sandbox::SandboxExecutor executor(codetutor::sandbox::ResolveSandboxOptions(config.sandbox));
    codetutor::questions::QuestionRepository questions(config.questions);
    std::shared_ptr<codetutor::providers::LLMProvider> provider = codetutor::providers::CreateProvider(config);
    codetutor::advisor::CodeAdvisor advisor(provider);
    codetutor::server::ApiServer api(executor, questions, advisor);

    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    std::atomic<bool> listen_failed{false};
    const auto host = config.server.host;
    const int port = config.server.port;
    std::thread http_thread([&api, &listen_failed, host, port]() {
        if (!api.Listen(host, port)) {
            codetutor::utils::LogError("api", "failed to listen on " + host + ":" + std::to_string(port));
            listen_failed.store(true);
        }
    });

    std::cout << "codetutor server started on " << host << ":" << port << ". Press Ctrl+C to stop." << std::endl;
    while (g_signal == 0 && !listen_failed.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    api.Stop();
    if (http_thread.joinable()) {
        http_thread.join();
    }
    executor.Shutdown();
    return listen_failed.load() ? 1 : 0;
}

int RunScript(const std::string& path, std::vector<std::string> inputs) {
    auto config = codetutor::config::LoadConfig();
    ApplyLogging(config);

    codetutor::sandbox::SubmissionRequest request;
    if (!ReadSource(path, request.code)) {
        std::cerr << "cannot read " << path << std::endl;
        return 1;
    }
    request.inputs = std::move(inputs);

    codetutor::sandbox::SandboxExecutor executor(codetutor::sandbox::ResolveSandboxOptions(config.sandbox));
    const auto result = executor.Submit(request);
    if (!result.output.empty()) {
        std::cout << result.output;
        if (result.output.back() != '\n') {
            std::cout << std::endl;
        }
    }
    if (!result.Succeeded()) {
        std::cerr << "error: " << result.error << std::endl;
        return 1;
    }
    return 0;
}

int CheckScript(const std::string& path) {
    std::string source;
    if (!ReadSource(path, source)) {
        std::cerr << "cannot read " << path << std::endl;
        return 1;
    }
    const codetutor::sandbox::Validator validator;
    const auto verdict = validator.Validate(source);
    if (!verdict.ok) {
        std::cout << codetutor::sandbox::ErrorKindName(verdict.kind) << ": " << verdict.reason;
        if (verdict.line > 0) {
            std::cout << " (line " << verdict.line << ")";
        }
        std::cout << std::endl;
        return 1;
    }
    std::cout << "ok" << std::endl;
    return 0;
}

void PrintUsage() {
    std::cout << "Usage:\n"
              << "  codetutor serve                     run the HTTP API\n"
              << "  codetutor run <file> [input...]     validate and run a script\n"
              << "  codetutor check <file>              validate a script only" << std::endl;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return 1;
    }
    const std::string command = argv[1];
    if (command == "serve") {
        return RunServe();
    }
    if (command == "run" && argc >= 3) {
        return RunScript(argv[2], std::vector<std::string>(argv + 3, argv + argc));
    }
    if (command == "check" && argc == 3) {
        return CheckScript(argv[2]);
    }
    PrintUsage();
    return 1;
}
