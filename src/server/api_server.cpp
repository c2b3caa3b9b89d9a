#include "server/api_server.hpp"

#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace codetutor::server {
namespace {

nlohmann::json Failure(const std::string& error) {
    return {{"success", false}, {"error", error}};
}

std::string StringField(const nlohmann::json& body, const char* key) {
    if (body.is_object() && body.contains(key) && body[key].is_string()) {
        return body[key].get<std::string>();
    }
    return {};
}

// A question may arrive as text or as {title, description}.
std::string QuestionText(const nlohmann::json& body) {
    if (!body.is_object() || !body.contains("question")) {
        return {};
    }
    const auto& question = body["question"];
    if (question.is_string()) {
        return question.get<std::string>();
    }
    if (question.is_object()) {
        return "Title: " + question.value("title", "") + "\nRequirements: " + question.value("description", "");
    }
    return {};
}

std::optional<advisor::ScoreReport> LastScore(const nlohmann::json& body) {
    if (!body.contains("last_score") || !body["last_score"].is_object()) {
        return std::nullopt;
    }
    const auto& score = body["last_score"];
    advisor::ScoreReport report;
    report.overall = score.value("overall", 0);
    report.time_complexity = score.value("time_complexity", 0);
    report.space_complexity = score.value("space_complexity", 0);
    report.readability = score.value("readability", 0);
    report.stability = score.value("stability", 0);
    return report;
}

std::string IsoTimestamp() {
    const auto now = std::chrono::system_clock::to_time_t(utils::Now());
    std::tm utc{};
    gmtime_r(&now, &utc);
    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

void SendJson(httplib::Response& res, const nlohmann::json& json, int status = 200) {
    res.status = status;
    res.set_content(ApiServer::Serialize(json), "application/json");
}

// Parses the body and runs `handler`, turning malformed JSON and escaped
// exceptions into structured replies.
void Dispatch(const httplib::Request& req,
              httplib::Response& res,
              const std::function<nlohmann::json(const nlohmann::json&)>& handler) {
    auto body = req.body.empty() ? nlohmann::json::object() : nlohmann::json::parse(req.body, nullptr, false);
    if (body.is_discarded()) {
        SendJson(res, Failure("request body is not valid JSON"), 400);
        return;
    }
    try {
        SendJson(res, handler(body));
    } catch (const std::exception& e) {
        utils::LogError("api", req.method + " " + req.path + " failed: " + e.what());
        SendJson(res, Failure(std::string("server error: ") + e.what()), 500);
    }
}

}  // namespace

ApiServer::ApiServer(sandbox::SandboxExecutor& executor,
                     questions::QuestionRepository& questions,
                     advisor::CodeAdvisor& advisor)
    : executor_(executor)
    , questions_(questions)
    , advisor_(advisor) {
    RegisterRoutes();
}

std::optional<sandbox::SubmissionRequest> ApiServer::ParseSubmission(const nlohmann::json& body, std::string& error) {
    if (!body.is_object()) {
        error = "request body must be a JSON object";
        return std::nullopt;
    }
    sandbox::SubmissionRequest request;
    if (body.contains("code") && !body["code"].is_null()) {
        if (!body["code"].is_string()) {
            error = "code must be a string";
            return std::nullopt;
        }
        request.code = body["code"].get<std::string>();
    }
    if (body.contains("inputs") && !body["inputs"].is_null()) {
        const auto& inputs = body["inputs"];
        if (!inputs.is_array()) {
            error = "inputs must be a list";
            return std::nullopt;
        }
        for (const auto& item : inputs) {
            if (!item.is_string()) {
                error = "each input must be a string";
                return std::nullopt;
            }
            request.inputs.push_back(item.get<std::string>());
        }
    }
    return request;
}

nlohmann::json ApiServer::HandleExecute(const nlohmann::json& body) {
    std::string error;
    const auto request = ParseSubmission(body, error);
    if (!request) {
        return Failure(error);
    }
    const auto result = executor_.Submit(*request);
    if (result.Succeeded()) {
        return {{"success", true}, {"output", result.output}};
    }
    auto reply = Failure(result.error);
    if (!result.output.empty()) {
        reply["output"] = result.output;
    }
    if (result.timed_out) {
        reply["timeout"] = true;
    }
    return reply;
}

nlohmann::json ApiServer::HandleValidate(const nlohmann::json& body) {
    const auto code = StringField(body, "code");
    if (utils::Trim(code).empty()) {
        return Failure("no code received");
    }
    const auto verdict = executor_.GetValidator().Validate(code);
    if (verdict.ok) {
        return {{"success", true}, {"message", "security check passed"}, {"error", nullptr}};
    }
    return {
        {"success", false},
        {"message", "security check failed: " + verdict.reason},
        {"error", verdict.reason},
        {"line", verdict.line}
    };
}

nlohmann::json ApiServer::HandleAnalyze(const nlohmann::json& body) {
    if (!advisor_.Ready()) {
        return Failure("AI advisor is not configured, check advisor.apiKeys");
    }
    const auto code = StringField(body, "code");
    if (utils::Trim(code).empty()) {
        return Failure("no code received");
    }
    const auto result = advisor_.Score(code,
                                       StringField(body, "output"),
                                       StringField(body, "expected_output"),
                                       QuestionText(body));
    if (!result.ok) {
        return Failure(result.error);
    }
    return {{"success", true}, {"analysis", result.report.ToJson()}};
}

nlohmann::json ApiServer::HandleCheck(const nlohmann::json& body) {
    if (!advisor_.Ready()) {
        return Failure("AI advisor is not configured, check advisor.apiKeys");
    }
    const auto result = advisor_.Check(StringField(body, "code"),
                                       StringField(body, "output"),
                                       StringField(body, "expected_output"));
    if (!result.ok) {
        return Failure(result.error);
    }
    return {{"success", true}, {"result", result.report.ToJson()}};
}

nlohmann::json ApiServer::HandleSuggest(const nlohmann::json& body) {
    if (!advisor_.Ready()) {
        return Failure("AI advisor is not configured, check advisor.apiKeys");
    }
    advisor::SuggestRequest request;
    request.code = StringField(body, "code");
    request.output = StringField(body, "output");
    if (body.contains("score") && body["score"].is_number()) {
        request.score = static_cast<int>(std::lround(body["score"].get<double>()));
    }
    if (body.contains("stats") && body["stats"].is_object()) {
        const auto& stats = body["stats"];
        request.stats.run_count = stats.value("run_count", 0);
        request.stats.error_count = stats.value("error_count", 0);
        request.stats.success_rate = stats.value("success_rate", 0.0);
        request.stats.modifications = stats.value("modifications", 0);
    }
    const auto result = advisor_.Suggest(request);
    if (!result.ok) {
        return Failure(result.error);
    }
    return {{"success", true}, {"suggestions", result.suggestions.ToJson()}};
}

std::optional<nlohmann::json> ApiServer::CheckChat(const nlohmann::json& body) const {
    if (!advisor_.Ready()) {
        return Failure("AI advisor is not configured");
    }
    if (utils::Trim(StringField(body, "message")).empty()) {
        return Failure("no message received");
    }
    return std::nullopt;
}

void ApiServer::HandleChat(const nlohmann::json& body, const std::function<bool(const std::string& frame)>& write) {
    advisor::ChatRequest request;
    request.message = StringField(body, "message");
    request.question = QuestionText(body);
    request.current_code = StringField(body, "current_code");
    request.current_output = StringField(body, "current_output");
    request.last_score = LastScore(body);
    advisor_.Chat(request, [&write](const advisor::ChatEvent& event) {
        return write(FormatSse(event));
    });
}

std::string ApiServer::FormatSse(const advisor::ChatEvent& event) {
    switch (event.kind) {
        case advisor::ChatEvent::Kind::kText:
            return "data: " + Serialize({{"text", event.text}}) + "\n\n";
        case advisor::ChatEvent::Kind::kError:
            return "data: " + Serialize({{"error", event.text}}) + "\n\n";
        case advisor::ChatEvent::Kind::kDone:
            break;
    }
    return "data: [DONE]\n\n";
}

std::string ApiServer::Serialize(const nlohmann::json& json) {
    return json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

nlohmann::json ApiServer::HandleListQuestions() {
    const auto list = questions_.List();
    if (!list.ok) {
        return Failure(list.error);
    }
    nlohmann::json questions = nlohmann::json::array();
    for (const auto& question : list.questions) {
        questions.push_back(question.ToJson());
    }
    nlohmann::json reply{{"success", true}, {"questions", questions}, {"cached", list.cached}};
    if (list.cached) {
        reply["cache_age_minutes"] = std::round(list.cache_age_minutes * 10.0) / 10.0;
    }
    if (list.from_file) {
        reply["from_file"] = true;
    }
    return reply;
}

nlohmann::json ApiServer::HandleGetQuestion(const std::string& id) {
    const auto question = questions_.Find(id);
    if (!question) {
        return Failure("question not found: " + id);
    }
    return {{"success", true}, {"question", question->ToJson()}};
}

nlohmann::json ApiServer::HandleRefreshQuestions() {
    const auto list = questions_.Refresh();
    if (!list.ok) {
        return Failure(list.error);
    }
    return {
        {"success", true},
        {"count", list.questions.size()},
        {"message", "reloaded " + std::to_string(list.questions.size()) + " questions"}
    };
}

nlohmann::json ApiServer::HandleHealth() const {
    return {{"status", "ok"}, {"timestamp", IsoTimestamp()}, {"advisor_ready", advisor_.Ready()}};
}

void ApiServer::RegisterRoutes() {
    http_server_.Post("/api/execute", [this](const httplib::Request& req, httplib::Response& res) {
        Dispatch(req, res, [this](const nlohmann::json& body) { return HandleExecute(body); });
    });
    http_server_.Post("/api/validate", [this](const httplib::Request& req, httplib::Response& res) {
        Dispatch(req, res, [this](const nlohmann::json& body) { return HandleValidate(body); });
    });
    http_server_.Post("/api/ai/analyze", [this](const httplib::Request& req, httplib::Response& res) {
        Dispatch(req, res, [this](const nlohmann::json& body) { return HandleAnalyze(body); });
    });
    http_server_.Post("/api/ai/check", [this](const httplib::Request& req, httplib::Response& res) {
        Dispatch(req, res, [this](const nlohmann::json& body) { return HandleCheck(body); });
    });
    http_server_.Post("/api/ai/suggest", [this](const httplib::Request& req, httplib::Response& res) {
        Dispatch(req, res, [this](const nlohmann::json& body) { return HandleSuggest(body); });
    });
    http_server_.Post("/api/ai/chat", [this](const httplib::Request& req, httplib::Response& res) {
        auto body = req.body.empty() ? nlohmann::json::object() : nlohmann::json::parse(req.body, nullptr, false);
        if (body.is_discarded()) {
            SendJson(res, Failure("request body is not valid JSON"), 400);
            return;
        }
        if (const auto rejection = CheckChat(body)) {
            SendJson(res, *rejection);
            return;
        }
        res.set_header("Cache-Control", "no-cache");
        res.set_header("X-Accel-Buffering", "no");
        res.set_chunked_content_provider(
            "text/event-stream",
            [this, body](std::size_t, httplib::DataSink& sink) {
                try {
                    HandleChat(body, [&sink](const std::string& frame) {
                        return sink.write(frame.data(), frame.size());
                    });
                } catch (const std::exception& e) {
                    utils::LogError("api", std::string("chat stream failed: ") + e.what());
                    const auto frame = FormatSse({advisor::ChatEvent::Kind::kError, e.what()}) +
                        FormatSse({advisor::ChatEvent::Kind::kDone, ""});
                    sink.write(frame.data(), frame.size());
                }
                sink.done();
                return true;
            });
    });
    http_server_.Get("/api/questions", [this](const httplib::Request& req, httplib::Response& res) {
        Dispatch(req, res, [this](const nlohmann::json&) { return HandleListQuestions(); });
    });
    http_server_.Get(R"(/api/questions/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        const auto id = req.matches[1].str();
        Dispatch(req, res, [this, id](const nlohmann::json&) { return HandleGetQuestion(id); });
    });
    http_server_.Post("/api/questions/refresh", [this](const httplib::Request& req, httplib::Response& res) {
        Dispatch(req, res, [this](const nlohmann::json&) { return HandleRefreshQuestions(); });
    });
    http_server_.Get("/api/health", [this](const httplib::Request&, httplib::Response& res) {
        SendJson(res, HandleHealth());
    });
    http_server_.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        utils::LogDebug("api", req.method + " " + req.path + " -> " + std::to_string(res.status));
    });
}

bool ApiServer::Listen(const std::string& host, int port) {
    utils::LogInfo("api", "listening on " + host + ":" + std::to_string(port));
    return http_server_.listen(host, port);
}

void ApiServer::Stop() {
    http_server_.stop();
}

}  // namespace codetutor::server
