#include "questions/question_repository.hpp"

#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>

#include "httplib.h"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace codetutor::questions {
namespace {

constexpr const char* kOpenParen = "\xEF\xBC\x88";   // full-width (
constexpr const char* kCloseParen = "\xEF\xBC\x89";  // full-width )

std::string DifficultyFor(const std::string& id) {
    if (id == "2") {
        return "elementary";
    }
    if (id == "3" || id == "4") {
        return "intermediate";
    }
    return "beginner";
}

// Splits "description (hint) more (hint)" into the text without the
// parenthesised parts and the hints themselves.
void SplitHints(const std::string& text, std::string& description, std::vector<std::string>& hints) {
    const std::string open = kOpenParen;
    const std::string close = kCloseParen;
    std::string stripped;
    std::size_t pos = 0;
    while (pos < text.size()) {
        const auto start = text.find(open, pos);
        if (start == std::string::npos) {
            stripped += text.substr(pos);
            break;
        }
        const auto end = text.find(close, start + open.size());
        if (end == std::string::npos) {
            stripped += text.substr(pos);
            break;
        }
        stripped += text.substr(pos, start - pos);
        const auto hint = text.substr(start + open.size(), end - start - open.size());
        if (!hint.empty()) {
            hints.push_back(hint);
        }
        pos = end + close.size();
    }
    description = utils::Trim(stripped);
    if (description.empty()) {
        description = text;
    }
}

std::vector<std::string> StringArray(const nlohmann::json& json, const char* key) {
    std::vector<std::string> items;
    if (json.contains(key) && json[key].is_array()) {
        for (const auto& item : json[key]) {
            if (item.is_string()) {
                items.push_back(item.get<std::string>());
            }
        }
    }
    return items;
}

}  // namespace

nlohmann::json Question::ToJson() const {
    return {
        {"id", id},
        {"title", title},
        {"description", description},
        {"difficulty", difficulty},
        {"hints", hints},
        {"example_image", example_image},
        {"learning_goals", learning_goals}
    };
}

std::optional<Question> Question::FromJson(const nlohmann::json& json) {
    if (!json.is_object() || !json.contains("id")) {
        return std::nullopt;
    }
    Question question;
    question.id = json["id"].is_string() ? json["id"].get<std::string>() : json["id"].dump();
    question.title = json.value("title", "");
    question.description = json.value("description", "");
    question.difficulty = json.value("difficulty", DifficultyFor(question.id));
    question.hints = StringArray(json, "hints");
    question.example_image = json.value("example_image", "");
    question.learning_goals = StringArray(json, "learning_goals");
    if (question.learning_goals.empty()) {
        question.learning_goals = QuestionRepository::LearningGoals(question.title);
    }
    return question;
}

std::optional<std::string> FetchOverHttp(const std::string& url) {
    const auto scheme_end = url.find("://");
    const auto path_start = url.find('/', scheme_end == std::string::npos ? 0 : scheme_end + 3);
    const auto origin = path_start == std::string::npos ? url : url.substr(0, path_start);
    const auto path = path_start == std::string::npos ? std::string("/") : url.substr(path_start);
    try {
        httplib::Client client(origin);
        client.set_follow_location(true);
        client.set_connection_timeout(10);
        client.set_read_timeout(10);
        auto response = client.Get(path);
        if (!response) {
            utils::LogWarn("questions", "sheet request failed: " + httplib::to_string(response.error()));
            return std::nullopt;
        }
        if (response->status != 200) {
            utils::LogWarn("questions", "sheet request failed: HTTP " + std::to_string(response->status));
            return std::nullopt;
        }
        return response->body;
    } catch (const std::exception& e) {
        utils::LogWarn("questions", std::string("sheet request failed: ") + e.what());
        return std::nullopt;
    }
}

QuestionRepository::QuestionRepository(config::QuestionsConfig config, SheetFetcher fetcher)
    : config_(std::move(config))
    , fetcher_(std::move(fetcher)) {}

std::vector<std::string> QuestionRepository::ParseCsvLine(const std::string& line) {
    std::vector<std::string> values;
    std::string current;
    bool in_quotes = false;
    for (std::size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (c == '"') {
            if (in_quotes && i + 1 < line.size() && line[i + 1] == '"') {
                current += '"';
                ++i;
            } else {
                in_quotes = !in_quotes;
            }
            continue;
        }
        if (c == ',' && !in_quotes) {
            values.push_back(std::move(current));
            current.clear();
            continue;
        }
        current += c;
    }
    values.push_back(std::move(current));
    return values;
}

std::vector<std::string> QuestionRepository::LearningGoals(const std::string& title) {
    struct Rule {
        std::vector<std::string> keywords;
        std::vector<std::string> goals;
    };
    static const std::vector<Rule> kRules = {
        {{"\xE5\xAD\x97\xE4\xB8\xB2", "string"}, {"Understand string operations", "Use string methods"}},
        {{"\xE6\x95\xB8\xE5\xAD\x97", "number"}, {"Understand numeric operations", "Use arithmetic operators"}},
        {{"\xE8\xBC\xB8\xE5\x85\xA5", "input"}, {"Use the input() function", "Convert between data types"}},
        {{"\xE7\xB8\xBD\xE5\x92\x8C", "sum"}, {"Accumulate values in a loop", "Use for loops"}},
        {{"\xE6\x9C\x80\xE5\xA4\xA7\xE5\x80\xBC", "maximum"}, {"Use conditionals", "Use comparison operators"}},
        {{"\xE6\xAF\x94\xE8\xBC\x83", "compare"}, {"Understand logical operators", "Use if/elif/else"}},
        {{"\xE5\x8F\x8D\xE8\xBD\x89", "reverse"}, {"Understand string slicing", "Use string indexing"}},
        {{"\xE5\x9B\x9E\xE6\x96\x87", "palindrome"}, {"Reason about symmetry", "Compare strings"}},
        {{"\xE6\x95\xB8\xE5\x88\x97", "sequence"}, {"Work with lists", "Use the list data structure"}},
        {{"\xE5\xB9\xB3\xE5\x9D\x87", "average"}, {"Compute simple statistics", "Use sum() and len()"}},
    };
    const auto lower = utils::ToLower(title);
    std::vector<std::string> goals;
    for (const auto& rule : kRules) {
        for (const auto& keyword : rule.keywords) {
            if (lower.find(keyword) != std::string::npos) {
                goals.insert(goals.end(), rule.goals.begin(), rule.goals.end());
                break;
            }
        }
    }
    if (goals.empty()) {
        goals = {"Understand basic Python syntax", "Practise program logic"};
    }
    if (goals.size() > 3) {
        goals.resize(3);
    }
    return goals;
}

std::vector<Question> QuestionRepository::ParseCsv(const std::string& csv) {
    static const std::regex kTaskPattern("Task\\s*(\\d+)\\s*(?:\xEF\xBC\x9A|:)\\s*(.+)");
    std::vector<Question> questions;
    std::istringstream stream(utils::Trim(csv));
    std::string line;
    if (!std::getline(stream, line)) {
        return questions;
    }
    const auto header_count = ParseCsvLine(line).size();
    std::size_t row = 1;
    while (std::getline(stream, line)) {
        ++row;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (utils::Trim(line).empty()) {
            continue;
        }
        auto values = ParseCsvLine(line);
        if (values.size() < header_count) {
            values.resize(header_count);
        }
        const auto task_info = values.size() > 0 ? values[0] : std::string();
        const auto description = values.size() > 1 ? values[1] : std::string();
        const auto example_image = values.size() > 2 ? values[2] : std::string();

        Question question;
        std::smatch match;
        if (std::regex_search(task_info, match, kTaskPattern)) {
            question.id = match[1].str();
            question.title = utils::Trim(match[2].str());
        } else {
            question.id = std::to_string(row - 1);
            question.title = task_info;
        }
        SplitHints(description, question.description, question.hints);
        question.difficulty = DifficultyFor(question.id);
        question.example_image = utils::Trim(example_image);
        question.learning_goals = LearningGoals(question.title);
        questions.push_back(std::move(question));
    }
    return questions;
}

std::optional<std::vector<Question>> QuestionRepository::FetchSheet() {
    if (config_.sheet_url.empty() || !fetcher_) {
        return std::nullopt;
    }
    const auto body = fetcher_(config_.sheet_url);
    if (!body) {
        return std::nullopt;
    }
    auto questions = ParseCsv(*body);
    if (questions.empty()) {
        utils::LogWarn("questions", "sheet export contained no questions");
        return std::nullopt;
    }
    utils::LogInfo("questions", "read " + std::to_string(questions.size()) + " questions from the sheet");
    return questions;
}

std::optional<std::vector<Question>> QuestionRepository::LoadFallback() const {
    if (config_.fallback_file.empty() || !std::filesystem::exists(config_.fallback_file)) {
        return std::nullopt;
    }
    try {
        std::ifstream input(config_.fallback_file);
        nlohmann::json data;
        input >> data;
        if (!data.is_array()) {
            utils::LogWarn("questions", config_.fallback_file + " does not hold a JSON array");
            return std::nullopt;
        }
        std::vector<Question> questions;
        for (const auto& item : data) {
            if (auto question = Question::FromJson(item)) {
                questions.push_back(std::move(*question));
            }
        }
        return questions;
    } catch (const std::exception& e) {
        utils::LogWarn("questions", "failed to read " + config_.fallback_file + ": " + e.what());
        return std::nullopt;
    }
}

void QuestionRepository::SaveFallback(const std::vector<Question>& questions) const {
    if (config_.fallback_file.empty()) {
        return;
    }
    nlohmann::json data = nlohmann::json::array();
    for (const auto& question : questions) {
        data.push_back(question.ToJson());
    }
    std::ofstream output(config_.fallback_file, std::ios::trunc);
    if (!output.is_open()) {
        utils::LogWarn("questions", "cannot write " + config_.fallback_file);
        return;
    }
    output << data.dump(2);
}

QuestionList QuestionRepository::List() {
    std::lock_guard<std::mutex> lock(mutex_);
    QuestionList result;
    const auto now = std::chrono::steady_clock::now();
    if (!cache_.empty() && fetched_at_) {
        const auto age = std::chrono::duration<double, std::ratio<60>>(now - *fetched_at_).count();
        if (age < config_.cache_minutes) {
            result.ok = true;
            result.questions = cache_;
            result.cached = true;
            result.cache_age_minutes = age;
            return result;
        }
    }
    if (auto fetched = FetchSheet()) {
        cache_ = std::move(*fetched);
        fetched_at_ = now;
        result.ok = true;
        result.questions = cache_;
        return result;
    }
    if (auto local = LoadFallback()) {
        result.ok = true;
        result.questions = std::move(*local);
        result.from_file = true;
        return result;
    }
    result.error = "unable to read question data";
    return result;
}

std::optional<Question> QuestionRepository::Find(const std::string& id) {
    std::vector<Question> questions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        questions = cache_;
    }
    if (questions.empty()) {
        questions = List().questions;
    }
    for (auto& question : questions) {
        if (question.id == id) {
            return std::move(question);
        }
    }
    return std::nullopt;
}

QuestionList QuestionRepository::Refresh() {
    QuestionList result;
    auto fetched = FetchSheet();
    if (!fetched) {
        result.error = "unable to read questions from the sheet";
        return result;
    }
    SaveFallback(*fetched);
    std::lock_guard<std::mutex> lock(mutex_);
    cache_ = *fetched;
    fetched_at_ = std::chrono::steady_clock::now();
    result.ok = true;
    result.questions = std::move(*fetched);
    return result;
}

}  // namespace codetutor::questions
