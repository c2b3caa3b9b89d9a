#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "providers/llm_provider.hpp"

namespace codetutor::advisor {

struct ScoreReport {
    std::string feedback;
    int overall = 0;
    int time_complexity = 0;
    int space_complexity = 0;
    int readability = 0;
    int stability = 0;

    nlohmann::json ToJson() const;
};

struct ScoreResult {
    bool ok = false;
    ScoreReport report;
    std::string error;
};

// Quick comparison of actual and expected output.
struct CheckReport {
    bool match = false;
    int score = 0;
    std::vector<std::string> differences;

    nlohmann::json ToJson() const;
};

struct CheckResult {
    bool ok = false;
    CheckReport report;
    std::string error;
};

struct LearningStats {
    int run_count = 0;
    int error_count = 0;
    double success_rate = 0.0;
    int modifications = 0;
};

struct SuggestRequest {
    std::string code;
    std::string output;
    std::optional<int> score;
    LearningStats stats;
};

struct Suggestions {
    std::string affirmation;
    std::string current_status;
    std::vector<std::string> hints;
    std::vector<std::string> follow_up_questions;

    nlohmann::json ToJson() const;
    // Generic guidance used when the model's reply cannot be read.
    static Suggestions Fallback();
};

struct SuggestResult {
    bool ok = false;
    Suggestions suggestions;
    std::string error;
};

struct ChatRequest {
    std::string message;
    std::string question;
    std::string current_code;
    std::string current_output;
    std::optional<ScoreReport> last_score;
};

struct ChatEvent {
    enum class Kind { kText, kError, kDone };
    Kind kind = Kind::kText;
    std::string text;
};

// Returning false stops the stream early.
using ChatSink = std::function<bool(const ChatEvent& event)>;

// Tutoring on top of an LLMProvider: structured code scoring, a quick output
// check, guided improvement hints and a guided chat that never hands out full
// solutions unless asked.
class CodeAdvisor {
public:
    // Credentials tried by the quick requests (Check, Suggest).
    static constexpr std::size_t kQuickAttempts = 3;

    explicit CodeAdvisor(std::shared_ptr<providers::LLMProvider> provider);

    bool Ready() const { return provider_ != nullptr; }

    ScoreResult Score(const std::string& code,
                      const std::string& output,
                      const std::string& expected_output,
                      const std::string& question);

    CheckResult Check(const std::string& code, const std::string& output, const std::string& expected_output);

    SuggestResult Suggest(const SuggestRequest& request);

    // Emits text chunks, an error event on failure, and always ends with kDone.
    void Chat(const ChatRequest& request, const ChatSink& sink);

    static const char* ScoreSchema();
    static std::string BuildScorePrompt(const std::string& code,
                                        const std::string& output,
                                        const std::string& expected_output,
                                        const std::string& question);
    static std::string BuildChatPrompt(const ChatRequest& request);
    static std::string BuildCheckPrompt(const std::string& code,
                                        const std::string& output,
                                        const std::string& expected_output);
    static std::string BuildSuggestPrompt(const SuggestRequest& request);

    // Reads the model's JSON reply and clamps every score into range.
    static ScoreResult ParseScore(const std::string& text);
    // An unreadable reply yields a neutral report (no match, score 50).
    static CheckReport ParseCheck(const std::string& text);
    static Suggestions ParseSuggestions(const std::string& text);

private:
    std::shared_ptr<providers::LLMProvider> provider_;
};

}  // namespace codetutor::advisor
