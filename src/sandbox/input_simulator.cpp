#include "sandbox/input_simulator.hpp"

namespace codetutor::sandbox {

InputSimulator::InputSimulator(std::vector<std::string> inputs, OutputSink& echo)
    : inputs_(std::move(inputs))
    , echo_(echo) {}

std::string InputSimulator::NextInput(const std::string& prompt) {
    if (cursor_ >= inputs_.size()) {
        throw EndOfInput("EOF when reading a line: all " + std::to_string(inputs_.size()) + " inputs consumed");
    }
    auto value = inputs_[cursor_++];
    if (!prompt.empty()) {
        echo_.Write(prompt);
    }
    echo_.Write(value + "\n");
    return value;
}

}  // namespace codetutor::sandbox
