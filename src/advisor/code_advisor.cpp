#include "advisor/code_advisor.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace codetutor::advisor {
namespace {

constexpr const char* kScoreSchema = R"json({
  "type": "object",
  "properties": {
    "feedback": {"type": "string", "description": "Overall review of the program with concrete suggestions"},
    "overall_score": {"type": "integer", "description": "Overall score (0-100)"},
    "time_complexity_score": {"type": "integer", "description": "Time complexity score (0-10)"},
    "space_complexity_score": {"type": "integer", "description": "Space complexity score (0-10)"},
    "readability_score": {"type": "integer", "description": "Readability score (0-10): naming, structure, comments"},
    "stability_score": {"type": "integer", "description": "Stability score (0-10): error handling and edge cases"}
  },
  "required": ["feedback", "overall_score", "time_complexity_score", "space_complexity_score",
               "readability_score", "stability_score"]
})json";

constexpr const char* kCheckSchema = R"json({
  "type": "object",
  "properties": {
    "match": {"type": "boolean", "description": "Whether the actual output matches the expected output exactly"},
    "score": {"type": "integer", "description": "Score (0-100)"},
    "differences": {"type": "array", "items": {"type": "string"}, "description": "Each difference found"}
  },
  "required": ["match", "score", "differences"]
})json";

constexpr const char* kSuggestSchema = R"json({
  "type": "object",
  "properties": {
    "affirmation": {"type": "string", "description": "Something the student did well"},
    "current_status": {"type": "string", "description": "Whether the program is correct so far and what is wrong"},
    "hints": {"type": "array", "items": {"type": "string"}, "description": "1 to 3 hints, not the solution"},
    "follow_up_questions": {"type": "array", "items": {"type": "string"}, "description": "3 to 5 questions Q1, Q2..."}
  },
  "required": ["affirmation", "current_status", "hints", "follow_up_questions"]
})json";

constexpr const char* kChatRules =
    "You are a friendly programming teacher who teaches through guided learning.\n\n"
    "[Teaching rules]\n"
    "1. Do not give the complete answer. Lead the student step by step with questions and hints.\n"
    "2. Start every reply by acknowledging something the student got right.\n"
    "3. Explain whether the current code is correct. If it is not, describe the problem simply and give 1 to 3 "
    "hints so the student can fix it.\n"
    "4. End every reply with 3 to 5 follow-up questions numbered Q1, Q2, Q3...\n"
    "5. Keep the tone supportive and clear.\n"
    "6. Unless the student explicitly asks for the full solution, only show key fragments or pseudocode.\n\n";

constexpr const char* kMarkdownRules =
    "\n\nFormat the reply as Markdown: headings with ## or ###, **bold** for key points, lists, `inline code`, "
    "fenced ```python blocks for multi-line code, > for quotes, and tables where a comparison helps.\n";

int ReadScore(const nlohmann::json& json, const char* key, int max) {
    if (!json.contains(key) || !json[key].is_number()) {
        return 0;
    }
    const auto value = static_cast<long long>(std::llround(json[key].get<double>()));
    return static_cast<int>(std::clamp<long long>(value, 0, max));
}

std::vector<std::string> ReadStrings(const nlohmann::json& json, const char* key) {
    std::vector<std::string> values;
    if (!json.contains(key) || !json[key].is_array()) {
        return values;
    }
    for (const auto& item : json[key]) {
        if (item.is_string()) {
            values.push_back(item.get<std::string>());
        }
    }
    return values;
}

std::string FailureMessage(const providers::LLMResponse& response, const std::string& action) {
    if (providers::IsQuotaError(response.status, response.content)) {
        return "all API keys have reached their quota, please try again in about a minute";
    }
    return action + " failed: " + response.content.substr(0, 200);
}

// Models sometimes wrap JSON in a ```json fence even when asked not to.
std::string StripFence(const std::string& text) {
    auto trimmed = utils::Trim(text);
    if (trimmed.rfind("```", 0) != 0) {
        return trimmed;
    }
    const auto first_newline = trimmed.find('\n');
    const auto closing = trimmed.rfind("```");
    if (first_newline == std::string::npos || closing <= first_newline) {
        return trimmed;
    }
    return trimmed.substr(first_newline + 1, closing - first_newline - 1);
}

}  // namespace

nlohmann::json ScoreReport::ToJson() const {
    return {
        {"feedback", feedback},
        {"overall_score", overall},
        {"time_complexity_score", time_complexity},
        {"space_complexity_score", space_complexity},
        {"readability_score", readability},
        {"stability_score", stability}
    };
}

nlohmann::json CheckReport::ToJson() const {
    return {{"match", match}, {"score", score}, {"differences", differences}};
}

nlohmann::json Suggestions::ToJson() const {
    return {
        {"affirmation", affirmation},
        {"current_status", current_status},
        {"hints", hints},
        {"follow_up_questions", follow_up_questions}
    };
}

Suggestions Suggestions::Fallback() {
    Suggestions suggestions;
    suggestions.affirmation = "Well done for getting started, writing the first lines is the hardest step.";
    suggestions.current_status = "The program still needs some work; let's look at what to improve together.";
    suggestions.hints = {
        "Think about which parts the program needs before writing more code",
        "Check the syntax line by line",
        "Run the program and read the error message carefully"};
    suggestions.follow_up_questions = {
        "Q1 What is this program supposed to do?",
        "Q2 What do you think the current code is missing?",
        "Q3 If the program fails, how would you find the problem?"};
    return suggestions;
}

CodeAdvisor::CodeAdvisor(std::shared_ptr<providers::LLMProvider> provider)
    : provider_(std::move(provider)) {}

const char* CodeAdvisor::ScoreSchema() {
    return kScoreSchema;
}

std::string CodeAdvisor::BuildScorePrompt(const std::string& code,
                                          const std::string& output,
                                          const std::string& expected_output,
                                          const std::string& question) {
    std::ostringstream prompt;
    prompt << "You are an experienced Python teacher. Review the student's program below.\n\n"
           << "[Task]\n"
           << (question.empty() ? "Write a Python program that prints the requested text." : question) << "\n\n"
           << "[Student code]\n```python\n" << code << "\n```\n\n"
           << "[Program output]\n" << (output.empty() ? "(not run yet)" : output) << "\n\n"
           << "[Expected output]\n" << (expected_output.empty() ? "(not provided)" : expected_output) << "\n\n"
           << "Provide six assessments:\n"
           << "1. feedback: whether the code is correct, whether the output matches, 3 to 5 concrete "
              "improvements, and any syntax or logic errors.\n"
           << "2. overall_score (0-100): all aspects combined.\n"
           << "3. time_complexity_score (0-10): algorithmic efficiency, needless loops or recomputation.\n"
           << "4. space_complexity_score (0-10): memory use, needless variables or structures.\n"
           << "5. readability_score (0-10): naming, structure, comments, consistent style.\n"
           << "6. stability_score (0-10): error handling, edge cases, possible runtime errors.\n\n"
           << "overall_score is out of 100; the other four scores are out of 10.";
    return prompt.str();
}

std::string CodeAdvisor::BuildChatPrompt(const ChatRequest& request) {
    std::ostringstream prompt;
    prompt << kChatRules;
    if (!request.question.empty()) {
        prompt << "[Current task]\n" << request.question << "\n\n";
    }
    if (!request.current_code.empty()) {
        prompt << "[Student's current code]\n```python\n" << request.current_code << "\n```\n\n";
    } else {
        prompt << "[Student's current code]\n(no code written yet)\n\n";
    }
    if (!request.current_output.empty()) {
        prompt << "[Current output]\n" << request.current_output << "\n\n";
    } else {
        prompt << "[Current output]\n(not run yet)\n\n";
    }
    if (request.last_score) {
        const auto& score = *request.last_score;
        prompt << "[Last AI score]\nOverall: " << score.overall << "/100\n"
               << "- Time complexity: " << score.time_complexity << "/10\n"
               << "- Space complexity: " << score.space_complexity << "/10\n"
               << "- Readability: " << score.readability << "/10\n"
               << "- Stability: " << score.stability << "/10\n\n";
    } else {
        prompt << "[Last AI score]\nNot scored yet\n\n";
    }
    prompt << "[Student question]\n" << request.message << "\n\n"
           << "Answer following the teaching rules, guiding the student to think for themselves, and end with "
              "3 to 5 follow-up questions (Q1, Q2, Q3...)."
           << kMarkdownRules;
    return prompt.str();
}

std::string CodeAdvisor::BuildCheckPrompt(const std::string& code,
                                          const std::string& output,
                                          const std::string& expected_output) {
    std::ostringstream prompt;
    prompt << "Quickly check this Python program.\n\n"
           << "Code:\n" << code << "\n\n"
           << "Actual output:\n" << output << "\n\n"
           << "Expected output:\n" << expected_output << "\n\n"
           << "Answer:\n"
           << "1. match: does the actual output match the expected output exactly?\n"
           << "2. score (0-100).\n"
           << "3. differences: where the outputs differ, empty when they match.";
    return prompt.str();
}

std::string CodeAdvisor::BuildSuggestPrompt(const SuggestRequest& request) {
    std::ostringstream prompt;
    prompt << kChatRules
           << "[Current situation]\n"
           << "Student score: " << (request.score ? std::to_string(*request.score) : "not scored yet") << "\n\n"
           << "Code:\n```python\n" << (request.code.empty() ? "(no code written yet)" : request.code) << "\n```\n\n"
           << "Output:\n" << (request.output.empty() ? "(not run yet)" : request.output) << "\n\n"
           << "Learning statistics:\n"
           << "- Runs: " << request.stats.run_count << "\n"
           << "- Errors: " << request.stats.error_count << "\n"
           << "- Success rate: " << request.stats.success_rate << "%\n"
           << "- Edits: " << request.stats.modifications << "\n\n"
           << "Reply with an affirmation, the current status, 1 to 3 hints and 3 to 5 follow-up questions "
              "(Q1, Q2, Q3...)."
           << kMarkdownRules;
    return prompt.str();
}

ScoreResult CodeAdvisor::ParseScore(const std::string& text) {
    ScoreResult result;
    const auto json = nlohmann::json::parse(StripFence(text), nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        result.error = "AI analysis failed: the model returned invalid JSON";
        return result;
    }
    if (!json.contains("feedback") || !json["feedback"].is_string()) {
        result.error = "AI analysis failed: the reply has no feedback";
        return result;
    }
    result.ok = true;
    result.report.feedback = json["feedback"].get<std::string>();
    result.report.overall = ReadScore(json, "overall_score", 100);
    result.report.time_complexity = ReadScore(json, "time_complexity_score", 10);
    result.report.space_complexity = ReadScore(json, "space_complexity_score", 10);
    result.report.readability = ReadScore(json, "readability_score", 10);
    result.report.stability = ReadScore(json, "stability_score", 10);
    return result;
}

CheckReport CodeAdvisor::ParseCheck(const std::string& text) {
    CheckReport report;
    const auto json = nlohmann::json::parse(StripFence(text), nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        report.score = 50;
        report.differences = {"could not read the AI reply"};
        return report;
    }
    report.match = json.contains("match") && json["match"].is_boolean() && json["match"].get<bool>();
    report.score = ReadScore(json, "score", 100);
    report.differences = ReadStrings(json, "differences");
    return report;
}

Suggestions CodeAdvisor::ParseSuggestions(const std::string& text) {
    const auto json = nlohmann::json::parse(StripFence(text), nullptr, false);
    if (json.is_discarded() || !json.is_object() || !json.contains("affirmation") || !json["affirmation"].is_string()) {
        return Suggestions::Fallback();
    }
    Suggestions suggestions;
    suggestions.affirmation = json["affirmation"].get<std::string>();
    suggestions.current_status = json.value("current_status", "");
    suggestions.hints = ReadStrings(json, "hints");
    suggestions.follow_up_questions = ReadStrings(json, "follow_up_questions");
    return suggestions;
}

ScoreResult CodeAdvisor::Score(const std::string& code,
                               const std::string& output,
                               const std::string& expected_output,
                               const std::string& question) {
    ScoreResult result;
    if (!provider_) {
        result.error = "AI advisor is not configured";
        return result;
    }
    if (utils::Trim(code).empty()) {
        result.error = "no code received";
        return result;
    }
    const auto response =
        provider_->Generate(BuildScorePrompt(code, output, expected_output, question), kScoreSchema, 0);
    if (response.IsError()) {
        utils::LogWarn("advisor", "scoring failed: " + response.content);
        result.error = FailureMessage(response, "AI analysis");
        return result;
    }
    return ParseScore(response.content);
}

CheckResult CodeAdvisor::Check(const std::string& code, const std::string& output, const std::string& expected_output) {
    CheckResult result;
    if (!provider_) {
        result.error = "AI advisor is not configured";
        return result;
    }
    const auto response =
        provider_->Generate(BuildCheckPrompt(code, output, expected_output), kCheckSchema, kQuickAttempts);
    if (response.IsError()) {
        utils::LogWarn("advisor", "output check failed: " + response.content);
        result.error = FailureMessage(response, "AI check");
        return result;
    }
    result.ok = true;
    result.report = ParseCheck(response.content);
    return result;
}

SuggestResult CodeAdvisor::Suggest(const SuggestRequest& request) {
    SuggestResult result;
    if (!provider_) {
        result.error = "AI advisor is not configured";
        return result;
    }
    const auto response = provider_->Generate(BuildSuggestPrompt(request), kSuggestSchema, kQuickAttempts);
    if (response.IsError()) {
        utils::LogWarn("advisor", "suggestions failed: " + response.content);
        result.error = FailureMessage(response, "AI suggestions");
        return result;
    }
    result.ok = true;
    result.suggestions = ParseSuggestions(response.content);
    return result;
}

void CodeAdvisor::Chat(const ChatRequest& request, const ChatSink& sink) {
    if (!provider_) {
        sink(ChatEvent{ChatEvent::Kind::kError, "AI advisor is not configured"});
        sink(ChatEvent{ChatEvent::Kind::kDone, ""});
        return;
    }
    const auto response = provider_->Stream(BuildChatPrompt(request), [&sink](const std::string& text) {
        return sink(ChatEvent{ChatEvent::Kind::kText, text});
    });
    if (response.IsError()) {
        utils::LogWarn("advisor", "chat failed: " + response.content);
        sink(ChatEvent{ChatEvent::Kind::kError, response.content});
    }
    sink(ChatEvent{ChatEvent::Kind::kDone, ""});
}

}  // namespace codetutor::advisor
