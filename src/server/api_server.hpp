#pragma once

#include <functional>
#include <optional>
#include <string>

#include "advisor/code_advisor.hpp"
#include "httplib.h"
#include "nlohmann/json.hpp"
#include "questions/question_repository.hpp"
#include "sandbox/sandbox_executor.hpp"

namespace codetutor::server {

// HTTP front end. Every route is a thin wrapper over a Handle* method that
// maps a JSON body to a JSON reply, so the handlers run without sockets.
class ApiServer {
public:
    ApiServer(sandbox::SandboxExecutor& executor,
              questions::QuestionRepository& questions,
              advisor::CodeAdvisor& advisor);

    ApiServer(const ApiServer&) = delete;
    ApiServer& operator=(const ApiServer&) = delete;

    nlohmann::json HandleExecute(const nlohmann::json& body);
    nlohmann::json HandleValidate(const nlohmann::json& body);
    nlohmann::json HandleAnalyze(const nlohmann::json& body);
    nlohmann::json HandleCheck(const nlohmann::json& body);
    nlohmann::json HandleSuggest(const nlohmann::json& body);
    // nullopt when the request is acceptable and the reply is a stream.
    std::optional<nlohmann::json> CheckChat(const nlohmann::json& body) const;
    void HandleChat(const nlohmann::json& body, const std::function<bool(const std::string& frame)>& write);
    nlohmann::json HandleListQuestions();
    nlohmann::json HandleGetQuestion(const std::string& id);
    nlohmann::json HandleRefreshQuestions();
    nlohmann::json HandleHealth() const;

    // Reads {code, inputs}; the error message is set when the shape is wrong.
    static std::optional<sandbox::SubmissionRequest> ParseSubmission(const nlohmann::json& body, std::string& error);
    static std::string FormatSse(const advisor::ChatEvent& event);
    // Compact JSON text; invalid UTF-8 in strings becomes U+FFFD instead of
    // failing the reply.
    static std::string Serialize(const nlohmann::json& json);

    // Blocks until Stop() is called or listening fails.
    bool Listen(const std::string& host, int port);
    void Stop();

private:
    sandbox::SandboxExecutor& executor_;
    questions::QuestionRepository& questions_;
    advisor::CodeAdvisor& advisor_;
    httplib::Server http_server_;

    void RegisterRoutes();
};

}  // namespace codetutor::server
