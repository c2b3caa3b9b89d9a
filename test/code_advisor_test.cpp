#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "advisor/code_advisor.hpp"
#include "fake_provider.hpp"

using codetutor::advisor::ChatEvent;
using codetutor::advisor::ChatRequest;
using codetutor::advisor::CodeAdvisor;
using codetutor::advisor::ScoreReport;
using codetutor::test::ErrorReply;
using codetutor::test::FakeProvider;

TEST(CodeAdvisorTest, ParseScoreReadsAllFields) {
    const auto result = CodeAdvisor::ParseScore(R"({
        "feedback": "Looks good", "overall_score": 85, "time_complexity_score": 8,
        "space_complexity_score": 9, "readability_score": 7, "stability_score": 6
    })");
    ASSERT_TRUE(result.ok) << result.error;
    EXPECT_EQ(result.report.feedback, "Looks good");
    EXPECT_EQ(result.report.overall, 85);
    EXPECT_EQ(result.report.time_complexity, 8);
    EXPECT_EQ(result.report.space_complexity, 9);
    EXPECT_EQ(result.report.readability, 7);
    EXPECT_EQ(result.report.stability, 6);
}

TEST(CodeAdvisorTest, ParseScoreClampsAndRounds) {
    const auto result = CodeAdvisor::ParseScore(
        R"({"feedback": "x", "overall_score": 140, "time_complexity_score": -2, "readability_score": 7.6})");
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.report.overall, 100);
    EXPECT_EQ(result.report.time_complexity, 0);
    EXPECT_EQ(result.report.readability, 8);
    EXPECT_EQ(result.report.stability, 0);
}

TEST(CodeAdvisorTest, ParseScoreStripsCodeFence) {
    const auto result = CodeAdvisor::ParseScore("```json\n{\"feedback\": \"fenced\", \"overall_score\": 50}\n```");
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.report.feedback, "fenced");
    EXPECT_EQ(result.report.overall, 50);
}

TEST(CodeAdvisorTest, ParseScoreRejectsInvalidReplies) {
    EXPECT_FALSE(CodeAdvisor::ParseScore("not json").ok);
    EXPECT_FALSE(CodeAdvisor::ParseScore(R"({"overall_score": 10})").ok);
}

TEST(CodeAdvisorTest, ScoreReportJsonKeys) {
    ScoreReport report;
    report.feedback = "f";
    report.overall = 90;
    const auto json = report.ToJson();
    EXPECT_EQ(json["overall_score"], 90);
    EXPECT_TRUE(json.contains("time_complexity_score"));
    EXPECT_TRUE(json.contains("stability_score"));
}

TEST(CodeAdvisorTest, ScoreWithoutProvider) {
    CodeAdvisor advisor(nullptr);
    EXPECT_FALSE(advisor.Ready());
    const auto result = advisor.Score("print(1)", "", "", "");
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error, "AI advisor is not configured");
}

TEST(CodeAdvisorTest, ScoreSendsPromptWithSchema) {
    auto provider = std::make_shared<FakeProvider>();
    provider->reply.content = R"({"feedback": "ok", "overall_score": 70})";
    CodeAdvisor advisor(provider);
    const auto result = advisor.Score("print('hi')", "hi\n", "hi\n", "Task 1: say hi");
    ASSERT_TRUE(result.ok) << result.error;
    EXPECT_EQ(result.report.overall, 70);
    ASSERT_EQ(provider->prompts.size(), 1u);
    EXPECT_NE(provider->prompts[0].find("print('hi')"), std::string::npos);
    EXPECT_NE(provider->prompts[0].find("Task 1: say hi"), std::string::npos);
    EXPECT_EQ(provider->schemas[0], CodeAdvisor::ScoreSchema());
    EXPECT_EQ(provider->attempts[0], 0u);
}

TEST(CodeAdvisorTest, ScoreRejectsEmptyCode) {
    auto provider = std::make_shared<FakeProvider>();
    CodeAdvisor advisor(provider);
    EXPECT_EQ(advisor.Score("  ", "", "", "").error, "no code received");
    EXPECT_TRUE(provider->prompts.empty());
}

TEST(CodeAdvisorTest, ScoreReportsQuotaExhaustion) {
    auto provider = std::make_shared<FakeProvider>();
    provider->reply = ErrorReply(429, "Error calling LLM: quota exceeded");
    CodeAdvisor advisor(provider);
    const auto result = advisor.Score("print(1)", "", "", "");
    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.error.find("quota"), std::string::npos);
}

TEST(CodeAdvisorTest, ScoreReportsOtherFailures) {
    auto provider = std::make_shared<FakeProvider>();
    provider->reply = ErrorReply(500, "Error calling LLM: HTTP 500");
    CodeAdvisor advisor(provider);
    EXPECT_EQ(advisor.Score("print(1)", "", "", "").error.rfind("AI analysis failed: ", 0), 0u);
}

TEST(CodeAdvisorTest, ParseCheckReadsReply) {
    const auto report = CodeAdvisor::ParseCheck(R"({"match": false, "score": 60, "differences": ["line 2 differs"]})");
    EXPECT_FALSE(report.match);
    EXPECT_EQ(report.score, 60);
    EXPECT_EQ(report.differences, (std::vector<std::string>{"line 2 differs"}));
    const auto json = report.ToJson();
    EXPECT_EQ(json["differences"][0], "line 2 differs");
}

TEST(CodeAdvisorTest, ParseCheckFallsBackOnUnreadableReply) {
    const auto report = CodeAdvisor::ParseCheck("the outputs look the same");
    EXPECT_FALSE(report.match);
    EXPECT_EQ(report.score, 50);
    ASSERT_EQ(report.differences.size(), 1u);
}

TEST(CodeAdvisorTest, CheckComparesOutputsWithQuickRetry) {
    auto provider = std::make_shared<FakeProvider>();
    provider->reply.content = "```json\n{\"match\": true, \"score\": 100, \"differences\": []}\n```";
    CodeAdvisor advisor(provider);
    const auto result = advisor.Check("print('hi')", "hi\n", "hi\n");
    ASSERT_TRUE(result.ok) << result.error;
    EXPECT_TRUE(result.report.match);
    EXPECT_EQ(result.report.score, 100);
    EXPECT_TRUE(result.report.differences.empty());
    ASSERT_EQ(provider->attempts.size(), 1u);
    EXPECT_EQ(provider->attempts[0], CodeAdvisor::kQuickAttempts);
    EXPECT_NE(provider->prompts[0].find("Expected output:\nhi"), std::string::npos);
}

TEST(CodeAdvisorTest, CheckReportsFailures) {
    auto provider = std::make_shared<FakeProvider>();
    provider->reply = ErrorReply(429, "Error calling LLM: quota exceeded");
    CodeAdvisor advisor(provider);
    EXPECT_NE(advisor.Check("x", "", "").error.find("quota"), std::string::npos);
    provider->reply = ErrorReply(500, "Error calling LLM: HTTP 500");
    EXPECT_EQ(advisor.Check("x", "", "").error.rfind("AI check failed: ", 0), 0u);
    EXPECT_EQ(CodeAdvisor(nullptr).Check("x", "", "").error, "AI advisor is not configured");
}

TEST(CodeAdvisorTest, SuggestPromptCarriesScoreAndStats) {
    codetutor::advisor::SuggestRequest request;
    request.code = "print('hi')";
    request.score = 72;
    request.stats.run_count = 4;
    request.stats.error_count = 1;
    request.stats.success_rate = 75;
    request.stats.modifications = 6;
    const auto prompt = CodeAdvisor::BuildSuggestPrompt(request);
    EXPECT_NE(prompt.find("Student score: 72"), std::string::npos);
    EXPECT_NE(prompt.find("- Runs: 4"), std::string::npos);
    EXPECT_NE(prompt.find("- Success rate: 75%"), std::string::npos);
    EXPECT_NE(prompt.find("(not run yet)"), std::string::npos);

    const auto unscored = CodeAdvisor::BuildSuggestPrompt(codetutor::advisor::SuggestRequest{});
    EXPECT_NE(unscored.find("not scored yet"), std::string::npos);
    EXPECT_NE(unscored.find("(no code written yet)"), std::string::npos);
}

TEST(CodeAdvisorTest, SuggestReadsStructuredHints) {
    auto provider = std::make_shared<FakeProvider>();
    provider->reply.content = R"({"affirmation": "Good start", "current_status": "Loop ends early",
        "hints": ["Check the range bounds"], "follow_up_questions": ["Q1 What does range(3) produce?"]})";
    CodeAdvisor advisor(provider);
    const auto result = advisor.Suggest(codetutor::advisor::SuggestRequest{});
    ASSERT_TRUE(result.ok) << result.error;
    EXPECT_EQ(result.suggestions.affirmation, "Good start");
    EXPECT_EQ(result.suggestions.hints, (std::vector<std::string>{"Check the range bounds"}));
    EXPECT_EQ(provider->attempts[0], CodeAdvisor::kQuickAttempts);
}

TEST(CodeAdvisorTest, SuggestFallsBackOnProseReply) {
    auto provider = std::make_shared<FakeProvider>();
    provider->reply.content = "## Nice work\nTry a loop.";
    CodeAdvisor advisor(provider);
    const auto result = advisor.Suggest(codetutor::advisor::SuggestRequest{});
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.suggestions.hints.size(), 3u);
    EXPECT_EQ(result.suggestions.follow_up_questions.size(), 3u);
    EXPECT_EQ(result.suggestions.affirmation, codetutor::advisor::Suggestions::Fallback().affirmation);
}

TEST(CodeAdvisorTest, ChatPromptCarriesContext) {
    ChatRequest request;
    request.message = "Why does my loop stop early?";
    request.question = "Task 2: count to ten";
    request.current_code = "for i in range(9):\n    print(i)";
    ScoreReport score;
    score.overall = 60;
    request.last_score = score;
    const auto prompt = CodeAdvisor::BuildChatPrompt(request);
    EXPECT_NE(prompt.find("Why does my loop stop early?"), std::string::npos);
    EXPECT_NE(prompt.find("Task 2: count to ten"), std::string::npos);
    EXPECT_NE(prompt.find("range(9)"), std::string::npos);
    EXPECT_NE(prompt.find("60/100"), std::string::npos);
    EXPECT_NE(prompt.find("(not run yet)"), std::string::npos);
}

TEST(CodeAdvisorTest, ChatStreamsThenFinishes) {
    auto provider = std::make_shared<FakeProvider>();
    provider->chunks = {"Good ", "start!"};
    CodeAdvisor advisor(provider);
    std::vector<ChatEvent> events;
    advisor.Chat(ChatRequest{"help", "", "", "", std::nullopt}, [&events](const ChatEvent& event) {
        events.push_back(event);
        return true;
    });
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0].text, "Good ");
    EXPECT_EQ(events[1].text, "start!");
    EXPECT_EQ(events[2].kind, ChatEvent::Kind::kDone);
}

TEST(CodeAdvisorTest, ChatErrorStillFinishes) {
    auto provider = std::make_shared<FakeProvider>();
    provider->stream_error = true;
    provider->reply = ErrorReply(0, "Error calling LLM: request failed");
    CodeAdvisor advisor(provider);
    std::vector<ChatEvent> events;
    advisor.Chat(ChatRequest{"help", "", "", "", std::nullopt}, [&events](const ChatEvent& event) {
        events.push_back(event);
        return true;
    });
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].kind, ChatEvent::Kind::kError);
    EXPECT_EQ(events[1].kind, ChatEvent::Kind::kDone);
}

TEST(CodeAdvisorTest, ChatWithoutProvider) {
    CodeAdvisor advisor(nullptr);
    std::vector<ChatEvent> events;
    advisor.Chat(ChatRequest{}, [&events](const ChatEvent& event) {
        events.push_back(event);
        return true;
    });
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].text, "AI advisor is not configured");
}
