#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <unistd.h>

#include "questions/question_repository.hpp"

using codetutor::questions::Question;
using codetutor::questions::QuestionRepository;

namespace fs = std::filesystem;

namespace {

const std::string kSheet =
    "Task,Description,Image\n"
    "Task 1: Print a string,\"Print hello, world\xEF\xBC\x88use print\xEF\xBC\x89\",https://img.example/1.png\n"
    "Task 2\xEF\xBC\x9A Sum of numbers,Add two numbers,\n"
    "\n"
    "Free exercise,\"Say \"\"hi\"\"\",\n";

class QuestionRepositoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() / ("codetutor_questions_test_" + std::to_string(::getpid()));
        fs::create_directories(dir_);
        config_.sheet_url = "https://sheet.example/export?format=csv";
        config_.fallback_file = (dir_ / "questions.json").string();
        config_.cache_minutes = 30;
    }

    void TearDown() override { fs::remove_all(dir_); }

    fs::path dir_;
    codetutor::config::QuestionsConfig config_;
};

}  // namespace

TEST(QuestionCsvTest, ParsesQuotedFields) {
    const auto values = QuestionRepository::ParseCsvLine("a,\"b, c\",\"say \"\"x\"\"\",");
    ASSERT_EQ(values.size(), 4u);
    EXPECT_EQ(values[0], "a");
    EXPECT_EQ(values[1], "b, c");
    EXPECT_EQ(values[2], "say \"x\"");
    EXPECT_EQ(values[3], "");
}

TEST(QuestionCsvTest, ParsesSheetRows) {
    const auto questions = QuestionRepository::ParseCsv(kSheet);
    ASSERT_EQ(questions.size(), 3u);

    EXPECT_EQ(questions[0].id, "1");
    EXPECT_EQ(questions[0].title, "Print a string");
    EXPECT_EQ(questions[0].description, "Print hello, world");
    ASSERT_EQ(questions[0].hints.size(), 1u);
    EXPECT_EQ(questions[0].hints[0], "use print");
    EXPECT_EQ(questions[0].example_image, "https://img.example/1.png");
    EXPECT_EQ(questions[0].difficulty, "beginner");

    EXPECT_EQ(questions[1].id, "2");
    EXPECT_EQ(questions[1].title, "Sum of numbers");
    EXPECT_EQ(questions[1].difficulty, "elementary");
    EXPECT_TRUE(questions[1].hints.empty());

    EXPECT_EQ(questions[2].id, "4");
    EXPECT_EQ(questions[2].title, "Free exercise");
    EXPECT_EQ(questions[2].description, "Say \"hi\"");
}

TEST(QuestionCsvTest, HeaderOnlyHasNoQuestions) {
    EXPECT_TRUE(QuestionRepository::ParseCsv("Task,Description\n").empty());
    EXPECT_TRUE(QuestionRepository::ParseCsv("").empty());
}

TEST(QuestionCsvTest, LearningGoals) {
    const auto goals = QuestionRepository::LearningGoals("Reverse a string");
    ASSERT_EQ(goals.size(), 3u);
    EXPECT_EQ(goals[0], "Understand string operations");
    EXPECT_EQ(QuestionRepository::LearningGoals("Anything").front(), "Understand basic Python syntax");
}

TEST(QuestionCsvTest, JsonRoundTripKeepsFields) {
    Question question;
    question.id = "3";
    question.title = "Compare";
    question.hints = {"use if"};
    const auto parsed = Question::FromJson(question.ToJson());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->id, "3");
    EXPECT_EQ(parsed->hints, question.hints);
    EXPECT_FALSE(Question::FromJson(nlohmann::json::object()).has_value());
}

TEST_F(QuestionRepositoryTest, ListFetchesThenServesCache) {
    int fetches = 0;
    QuestionRepository repository(config_, [&fetches](const std::string&) -> std::optional<std::string> {
        ++fetches;
        return kSheet;
    });
    const auto first = repository.List();
    ASSERT_TRUE(first.ok) << first.error;
    EXPECT_FALSE(first.cached);
    EXPECT_EQ(first.questions.size(), 3u);

    const auto second = repository.List();
    EXPECT_TRUE(second.cached);
    EXPECT_EQ(second.questions.size(), 3u);
    EXPECT_EQ(fetches, 1);
}

TEST_F(QuestionRepositoryTest, ExpiredCacheIsRefetched) {
    config_.cache_minutes = 0;
    int fetches = 0;
    QuestionRepository repository(config_, [&fetches](const std::string&) -> std::optional<std::string> {
        ++fetches;
        return kSheet;
    });
    repository.List();
    const auto again = repository.List();
    EXPECT_FALSE(again.cached);
    EXPECT_EQ(fetches, 2);
}

TEST_F(QuestionRepositoryTest, FallsBackToLocalFile) {
    {
        std::ofstream output(config_.fallback_file);
        output << R"([{"id": "7", "title": "Average height", "description": "d"}])";
    }
    QuestionRepository repository(config_, [](const std::string&) -> std::optional<std::string> {
        return std::nullopt;
    });
    const auto list = repository.List();
    ASSERT_TRUE(list.ok);
    EXPECT_TRUE(list.from_file);
    ASSERT_EQ(list.questions.size(), 1u);
    EXPECT_EQ(list.questions[0].id, "7");
    EXPECT_EQ(list.questions[0].difficulty, "beginner");
    EXPECT_EQ(list.questions[0].learning_goals.front(), "Compute simple statistics");
}

TEST_F(QuestionRepositoryTest, NoSourceIsAnError) {
    QuestionRepository repository(config_, [](const std::string&) -> std::optional<std::string> {
        return std::nullopt;
    });
    const auto list = repository.List();
    EXPECT_FALSE(list.ok);
    EXPECT_EQ(list.error, "unable to read question data");
}

TEST_F(QuestionRepositoryTest, RefreshWritesLocalCopyAndFindWorks) {
    bool online = true;
    QuestionRepository repository(config_, [&online](const std::string&) -> std::optional<std::string> {
        if (!online) {
            return std::nullopt;
        }
        return kSheet;
    });
    const auto refreshed = repository.Refresh();
    ASSERT_TRUE(refreshed.ok);
    EXPECT_TRUE(fs::exists(config_.fallback_file));

    const auto found = repository.Find("2");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->title, "Sum of numbers");
    EXPECT_FALSE(repository.Find("99").has_value());

    online = false;
    QuestionRepository offline(config_, [](const std::string&) -> std::optional<std::string> {
        return std::nullopt;
    });
    const auto list = offline.List();
    ASSERT_TRUE(list.ok);
    EXPECT_TRUE(list.from_file);
    EXPECT_EQ(list.questions.size(), 3u);
}
