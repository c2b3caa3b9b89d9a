#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

#include "sandbox/output_capture.hpp"

namespace codetutor::sandbox {

// Thrown when a read arrives after every input has been consumed.
class EndOfInput : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Answers interactive reads from a fixed list, one per call, and echoes the
// prompt and the answer into captured stdout as the read happens.
class InputSimulator {
public:
    InputSimulator(std::vector<std::string> inputs, OutputSink& echo);

    InputSimulator(const InputSimulator&) = delete;
    InputSimulator& operator=(const InputSimulator&) = delete;

    std::string NextInput(const std::string& prompt);

    // The run's stdout, shared with print().
    OutputSink& Stdout() { return echo_; }

    std::size_t Consumed() const { return cursor_; }
    std::size_t Remaining() const { return inputs_.size() - cursor_; }

private:
    std::vector<std::string> inputs_;
    std::size_t cursor_ = 0;
    OutputSink& echo_;
};

}  // namespace codetutor::sandbox
