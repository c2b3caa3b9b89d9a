#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>

#include "sandbox/cancellation.hpp"
#include "sandbox/python_runtime.hpp"
#include "script_harness.hpp"

using codetutor::sandbox::CancellationToken;
using codetutor::sandbox::PythonRuntime;
using codetutor::test::Output;
using codetutor::test::RunScript;

TEST(PythonRuntimeTest, ReportsInterpreterVersion) {
    const auto& version = PythonRuntime::Instance().Version();
    EXPECT_EQ(version.rfind("3.", 0), 0u) << version;
}

TEST(PythonRuntimeTest, BigIntegers) {
    EXPECT_EQ(Output("print(2 ** 64)\n"), "18446744073709551616\n");
    EXPECT_EQ(Output("import math\nprint(math.factorial(25))\n"), "15511210043330985984000000\n");
}

TEST(PythonRuntimeTest, ClassesWithSuperAndGenerators) {
    const auto out = Output(
        "class Counter:\n"
        "    def __init__(self, start):\n"
        "        self.value = start\n"
        "    def __repr__(self):\n"
        "        return f'Counter({self.value})'\n"
        "class Stepper(Counter):\n"
        "    def __init__(self):\n"
        "        super().__init__(10)\n"
        "def evens(limit):\n"
        "    n = 0\n"
        "    while n < limit:\n"
        "        yield n\n"
        "        n += 2\n"
        "print(Stepper(), list(evens(7)))\n");
    EXPECT_EQ(out, "Counter(10) [0, 2, 4, 6]\n");
}

TEST(PythonRuntimeTest, UnicodeCaseMapping) {
    EXPECT_EQ(Output("print('straße'.upper())\n"), "STRASSE\n");
}

TEST(PythonRuntimeTest, DateDecimalAndFractions) {
    EXPECT_EQ(Output("import datetime\nprint(datetime.date(2024, 2, 28) + datetime.timedelta(days=2))\n"),
              "2024-03-01\n");
    EXPECT_EQ(Output("from decimal import Decimal\nprint(Decimal('0.1') + Decimal('0.2'))\n"), "0.3\n");
    EXPECT_EQ(Output("from fractions import Fraction\nprint(Fraction(1, 3) + Fraction(1, 6))\n"), "1/2\n");
}

TEST(PythonRuntimeTest, PrintSeparatorAndEnd) {
    EXPECT_EQ(Output("print(1, 2, 3, sep='-', end='!')\nprint()\n"), "1-2-3!\n");
    EXPECT_EQ(Output("print('a', 'b', sep=None)\n"), "a b\n");
    const auto run = RunScript("print(1, sep=5)\n");
    EXPECT_EQ(run.error_type, "TypeError");
}

TEST(PythonRuntimeTest, MainModuleName) {
    EXPECT_EQ(Output("if __name__ == '__main__':\n    print('main')\n"), "main\n");
}

TEST(PythonRuntimeTest, ImportOfForbiddenModuleRaisesImportError) {
    const auto run = RunScript("import os\n");
    EXPECT_EQ(run.error_type, "ImportError");
    EXPECT_NE(run.error_message.find("permission denied"), std::string::npos);
    EXPECT_EQ(run.error_line, 1);
}

TEST(PythonRuntimeTest, ModulesExposeOnlyPublicNames) {
    EXPECT_EQ(Output("import random\nprint(hasattr(random, '_os'), hasattr(random, 'randint'))\n"), "False True\n");
    EXPECT_EQ(Output("import datetime\nprint(hasattr(datetime, 'sys'))\n"), "False\n");
    const auto run = RunScript("from json import decoder\n");
    EXPECT_EQ(run.error_type, "ImportError");
}

TEST(PythonRuntimeTest, GetattrRefusesDunderNames) {
    const auto run = RunScript("x = getattr(len, '__self__')\n");
    EXPECT_EQ(run.error_type, "AttributeError");
    EXPECT_EQ(run.error_message, "attribute access not allowed: __self__");
    EXPECT_EQ(Output("print(hasattr(len, '__self__'), getattr('ab', 'upper')())\n"), "False AB\n");
}

TEST(PythonRuntimeTest, HostAccessIsRefusedThroughFormatterEscape) {
    const auto run = RunScript(
        "import string\n"
        "f = string.Formatter().get_field('0.__globals__', [string.capwords], {})[0]['__builtins__']['open']\n"
        "f('/etc/passwd')\n");
    EXPECT_EQ(run.error_line, 3);
    EXPECT_EQ(run.error_type, "PermissionError");
    EXPECT_NE(run.error_message.find("operation not permitted in the sandbox: open"), std::string::npos);
}

TEST(PythonRuntimeTest, ErrorLineAndTraceback) {
    const auto run = RunScript("items = [1, 2]\nprint(items[5])\n");
    EXPECT_EQ(run.error_type, "IndexError");
    EXPECT_EQ(run.error_message, "list index out of range");
    EXPECT_EQ(run.error_line, 2);
    EXPECT_EQ(run.err.rfind("Traceback (most recent call last):", 0), 0u);
    EXPECT_NE(run.err.find("IndexError: list index out of range"), std::string::npos);
}

TEST(PythonRuntimeTest, ErrorLineInsideLibraryCallPointsAtSubmission) {
    const auto run = RunScript("import json\ndata = json.loads('{')\n");
    EXPECT_EQ(run.error_type, "JSONDecodeError");
    EXPECT_EQ(run.error_line, 2);
}

TEST(PythonRuntimeTest, LoneSurrogateIsEscaped) {
    EXPECT_EQ(Output("print(chr(0xD800))\n"), "\\ud800\n");
}

TEST(PythonRuntimeTest, InputAndEndOfInput) {
    const auto run = RunScript("a = input('a? ')\nb = input()\nprint(a + b)\ninput()\n", {"x", "y"});
    EXPECT_EQ(run.out, "a? x\ny\nxy\n");
    EXPECT_EQ(run.error_type, "EOFError");
    EXPECT_EQ(run.error_line, 4);
}

TEST(PythonRuntimeTest, CancellationStopsALoopThatCatchesEverything) {
    CancellationToken token;
    std::thread canceller([token]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        token.Cancel();
    });
    const auto run = RunScript(
        "while True:\n"
        "    try:\n"
        "        while True:\n"
        "            pass\n"
        "    except BaseException:\n"
        "        pass\n",
        {}, token);
    canceller.join();
    EXPECT_TRUE(run.cancelled);
    EXPECT_TRUE(run.error_type.empty());
}

TEST(PythonRuntimeTest, AlreadyCancelledTokenStopsAtFirstLine) {
    CancellationToken token;
    token.Cancel();
    const auto run = RunScript("print('never')\n", {}, token);
    EXPECT_TRUE(run.cancelled);
    EXPECT_EQ(run.out, "");
}
