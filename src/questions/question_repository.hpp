#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace codetutor::questions {

struct Question {
    std::string id;
    std::string title;
    std::string description;
    std::string difficulty;
    std::vector<std::string> hints;
    std::string example_image;
    std::vector<std::string> learning_goals;

    nlohmann::json ToJson() const;
    static std::optional<Question> FromJson(const nlohmann::json& json);
};

struct QuestionList {
    bool ok = false;
    std::vector<Question> questions;
    bool cached = false;
    bool from_file = false;
    double cache_age_minutes = 0.0;
    std::string error;
};

// Downloads the sheet export; nullopt on any network or HTTP failure.
using SheetFetcher = std::function<std::optional<std::string>(const std::string& url)>;

std::optional<std::string> FetchOverHttp(const std::string& url);

// Exercise catalogue read from a spreadsheet CSV export, cached for a few
// minutes and backed by a local JSON copy when the sheet is unreachable.
class QuestionRepository {
public:
    explicit QuestionRepository(config::QuestionsConfig config, SheetFetcher fetcher = FetchOverHttp);

    QuestionList List();
    std::optional<Question> Find(const std::string& id);

    // Re-reads the sheet, replaces the cache and rewrites the local copy.
    QuestionList Refresh();

    static std::vector<std::string> ParseCsvLine(const std::string& line);
    static std::vector<Question> ParseCsv(const std::string& csv);
    static std::vector<std::string> LearningGoals(const std::string& title);

private:
    config::QuestionsConfig config_;
    SheetFetcher fetcher_;
    std::mutex mutex_;
    std::vector<Question> cache_;
    std::optional<std::chrono::steady_clock::time_point> fetched_at_;

    std::optional<std::vector<Question>> FetchSheet();
    std::optional<std::vector<Question>> LoadFallback() const;
    void SaveFallback(const std::vector<Question>& questions) const;
};

}  // namespace codetutor::questions
