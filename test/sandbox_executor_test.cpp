#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "config/config_schema.hpp"
#include "sandbox/sandbox_executor.hpp"

using codetutor::sandbox::ErrorKind;
using codetutor::sandbox::ExecResult;
using codetutor::sandbox::RunState;
using codetutor::sandbox::SandboxExecutor;
using codetutor::sandbox::SandboxOptions;
using codetutor::sandbox::SubmissionRequest;

namespace {

SandboxOptions FastOptions() {
    SandboxOptions options;
    options.timeout = std::chrono::milliseconds(500);
    options.max_concurrent_runs = 2;
    return options;
}

}  // namespace

TEST(SandboxExecutorTest, RunsSimpleProgram) {
    SandboxExecutor executor(FastOptions());
    const auto result = executor.Submit(SubmissionRequest{"print(1+2)", {}});
    EXPECT_TRUE(result.Succeeded());
    EXPECT_EQ(result.state, RunState::kCompleted);
    EXPECT_EQ(result.output, "3\n");
    EXPECT_TRUE(result.error.empty());
}

TEST(SandboxExecutorTest, EchoesInteractiveInput) {
    SandboxExecutor executor(FastOptions());
    const auto result = executor.Submit(SubmissionRequest{"x = input(\"name? \"); print(x)", {"hi"}});
    ASSERT_TRUE(result.Succeeded()) << result.error;
    EXPECT_EQ(result.output, "name? hi\nhi\n");
}

TEST(SandboxExecutorTest, BlocksForbiddenImportBeforeRunning) {
    SandboxExecutor executor(FastOptions());
    const auto result = executor.Submit(SubmissionRequest{"import os\nprint('ran')", {}});
    EXPECT_FALSE(result.Succeeded());
    EXPECT_TRUE(result.blocked);
    EXPECT_EQ(result.kind, ErrorKind::kPolicyViolation);
    EXPECT_NE(result.error.find("security check failed"), std::string::npos);
    EXPECT_NE(result.error.find("os"), std::string::npos);
    EXPECT_EQ(result.output.find("ran"), std::string::npos);
}

TEST(SandboxExecutorTest, ReportsSyntaxErrors) {
    SandboxExecutor executor(FastOptions());
    const auto result = executor.Submit(SubmissionRequest{"print(", {}});
    EXPECT_TRUE(result.blocked);
    EXPECT_EQ(result.kind, ErrorKind::kSyntaxInvalid);
}

TEST(SandboxExecutorTest, RejectsEmptyCode) {
    SandboxExecutor executor(FastOptions());
    const auto empty = executor.Submit(SubmissionRequest{"  \n", {}});
    EXPECT_TRUE(empty.blocked);
    EXPECT_EQ(empty.kind, ErrorKind::kSyntaxInvalid);
    EXPECT_EQ(empty.error, "no code received");
}

TEST(SandboxExecutorTest, RequestsOverLimitsExhaustResources) {
    SandboxExecutor executor(FastOptions());
    const auto too_long = executor.Submit(SubmissionRequest{std::string(50001, '#'), {}});
    EXPECT_TRUE(too_long.blocked);
    EXPECT_EQ(too_long.kind, ErrorKind::kResourceExhausted);

    const auto too_many = executor.Submit(SubmissionRequest{"print(1)", std::vector<std::string>(101, "x")});
    EXPECT_TRUE(too_many.blocked);
    EXPECT_EQ(too_many.kind, ErrorKind::kResourceExhausted);

    const auto too_wide = executor.Submit(SubmissionRequest{"print(input())", {std::string(1001, 'x')}});
    EXPECT_TRUE(too_wide.blocked);
    EXPECT_EQ(too_wide.kind, ErrorKind::kResourceExhausted);
}

TEST(SandboxExecutorTest, IntegersHaveArbitraryPrecision) {
    SandboxExecutor executor(FastOptions());
    const auto result = executor.Submit(SubmissionRequest{
        "import math\n"
        "print(2 ** 64)\n"
        "print(math.factorial(25))\n"
        "a, b = 0, 1\n"
        "for _ in range(100):\n"
        "    a, b = b, a + b\n"
        "print(a)\n",
        {}});
    ASSERT_TRUE(result.Succeeded()) << result.error;
    EXPECT_EQ(result.output, "18446744073709551616\n15511210043330985984000000\n354224848179261915075\n");
}

TEST(SandboxExecutorTest, RunsClassesAndGenerators) {
    SandboxExecutor executor(FastOptions());
    const auto result = executor.Submit(SubmissionRequest{
        "class Animal:\n"
        "    def __init__(self, name):\n"
        "        self.name = name\n"
        "    def speak(self):\n"
        "        return self.name + ' makes a sound'\n"
        "class Dog(Animal):\n"
        "    def speak(self):\n"
        "        return super().speak() + ': woof'\n"
        "def squares(n):\n"
        "    for i in range(n):\n"
        "        yield i * i\n"
        "print(Dog('Rex').speak())\n"
        "print(list(squares(4)))\n"
        "print('straße'.upper())\n",
        {}});
    ASSERT_TRUE(result.Succeeded()) << result.error;
    EXPECT_EQ(result.output, "Rex makes a sound: woof\n[0, 1, 4, 9]\nSTRASSE\n");
}

TEST(SandboxExecutorTest, LoneSurrogateIsEscapedInOutput) {
    SandboxExecutor executor(FastOptions());
    const auto result = executor.Submit(SubmissionRequest{"print(chr(0xD800))", {}});
    ASSERT_TRUE(result.Succeeded()) << result.error;
    EXPECT_EQ(result.output, "\\ud800\n");
}

TEST(SandboxExecutorTest, RuntimeImportOfHiddenModuleFails) {
    SandboxExecutor executor(FastOptions());
    const auto result = executor.Run("m = 'o' + 's'\nprint(__builtins__['__import__'](m))\n", {});
    EXPECT_EQ(result.kind, ErrorKind::kRuntimeFailure);
    EXPECT_NE(result.error.find("permission denied: module 'os' is not allowed"), std::string::npos);
}

TEST(SandboxExecutorTest, TruncatesLongOutput) {
    SandboxExecutor executor(FastOptions());
    const auto result = executor.Submit(SubmissionRequest{"print('x' * 20000)", {}});
    ASSERT_TRUE(result.Succeeded()) << result.error;
    EXPECT_EQ(result.output, std::string(10000, 'x') + codetutor::sandbox::kTruncationMarker);
}

TEST(SandboxExecutorTest, OutputAtCapIsUntouched) {
    SandboxExecutor executor(FastOptions());
    const auto result = executor.Submit(SubmissionRequest{"print('x' * 9999)", {}});
    ASSERT_TRUE(result.Succeeded()) << result.error;
    EXPECT_EQ(result.output, std::string(9999, 'x') + "\n");
}

TEST(SandboxExecutorTest, InfiniteLoopTimesOut) {
    SandboxExecutor executor(FastOptions());
    const auto started = std::chrono::steady_clock::now();
    const auto result = executor.Submit(SubmissionRequest{"while True:\n    pass\n", {}});
    const auto elapsed = std::chrono::steady_clock::now() - started;
    EXPECT_EQ(result.state, RunState::kTimedOut);
    EXPECT_EQ(result.kind, ErrorKind::kTimeoutExceeded);
    EXPECT_TRUE(result.timed_out);
    EXPECT_NE(result.error.find("timed out"), std::string::npos);
    EXPECT_GE(elapsed, std::chrono::milliseconds(500));
}

TEST(SandboxExecutorTest, ReadPastInputsFailsWithEndOfInput) {
    SandboxExecutor executor(FastOptions());
    const auto result = executor.Submit(SubmissionRequest{"a = input()\nb = input()\nprint(a, b)", {"only"}});
    EXPECT_FALSE(result.Succeeded());
    EXPECT_EQ(result.kind, ErrorKind::kEndOfInput);
    EXPECT_EQ(result.error.rfind("EOFError: ", 0), 0u);
    EXPECT_EQ(result.output.rfind("only\n", 0), 0u);
}

TEST(SandboxExecutorTest, RuntimeErrorKeepsOutputAndTraceback) {
    SandboxExecutor executor(FastOptions());
    const auto result = executor.Submit(SubmissionRequest{"print('before')\nprint(1 / 0)", {}});
    EXPECT_EQ(result.state, RunState::kFailed);
    EXPECT_EQ(result.kind, ErrorKind::kRuntimeFailure);
    EXPECT_FALSE(result.blocked);
    EXPECT_EQ(result.error, "ZeroDivisionError: division by zero (line 2)");
    EXPECT_EQ(result.output.rfind("before\n\nTraceback", 0), 0u);
}

TEST(SandboxExecutorTest, SilentProgramGetsSentinel) {
    SandboxExecutor executor(FastOptions());
    const auto result = executor.Submit(SubmissionRequest{"x = 1", {}});
    ASSERT_TRUE(result.Succeeded());
    EXPECT_EQ(result.output, codetutor::sandbox::kNoOutputSentinel);
}

TEST(SandboxExecutorTest, RejectsWhenAtCapacity) {
    SandboxOptions options;
    options.timeout = std::chrono::milliseconds(1500);
    options.max_concurrent_runs = 1;
    SandboxExecutor executor(options);

    ExecResult looping;
    std::thread runner([&executor, &looping]() {
        looping = executor.Run("while True:\n    pass\n", {});
    });
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(1);
    while (executor.InFlight() == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    ASSERT_EQ(executor.InFlight(), 1u);

    const auto busy = executor.Submit(SubmissionRequest{"print(1)", {}});
    EXPECT_EQ(busy.kind, ErrorKind::kResourceExhausted);
    EXPECT_TRUE(busy.blocked);
    EXPECT_EQ(busy.error, "server busy, please try again later");

    runner.join();
    EXPECT_TRUE(looping.timed_out);
}

TEST(SandboxExecutorTest, RejectsAfterShutdown) {
    SandboxExecutor executor(FastOptions());
    executor.Shutdown();
    const auto result = executor.Run("print(1)", {});
    EXPECT_EQ(result.kind, ErrorKind::kResourceExhausted);
}

TEST(SandboxExecutorTest, ComposeOutput) {
    EXPECT_EQ(SandboxExecutor::ComposeOutput("out", "err", 100), "out\nerr");
    EXPECT_EQ(SandboxExecutor::ComposeOutput("", "err", 100), "err");
    EXPECT_EQ(SandboxExecutor::ComposeOutput("out", "", 100), "out");
    EXPECT_EQ(SandboxExecutor::ComposeOutput("abcdef", "", 3), std::string("abc") + codetutor::sandbox::kTruncationMarker);
}

TEST(SandboxExecutorTest, OptionsFromConfig) {
    codetutor::config::SandboxConfig config;
    config.timeout_seconds = 3;
    config.max_output_chars = 200;
    const auto options = codetutor::sandbox::ResolveSandboxOptions(config);
    EXPECT_EQ(options.timeout, std::chrono::milliseconds(3000));
    EXPECT_EQ(options.max_output_chars, 200u);
    EXPECT_EQ(options.limits.max_code_chars, 50000u);
    EXPECT_EQ(options.max_concurrent_runs, 8u);
}
