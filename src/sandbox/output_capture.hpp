#pragma once

#include <cstddef>
#include <string>

namespace codetutor::sandbox {

class OutputSink {
public:
    virtual ~OutputSink() = default;
    virtual void Write(const std::string& text) = 0;
};

// In-memory stdout/stderr for one run. Keeps at most `limit` code points and
// drops the rest, remembering that it did.
class OutputCapture : public OutputSink {
public:
    explicit OutputCapture(std::size_t limit);

    void Write(const std::string& text) override;

    const std::string& Text() const { return text_; }
    std::size_t Length() const { return length_; }
    bool Overflowed() const { return overflowed_; }

private:
    std::size_t limit_;
    std::size_t length_ = 0;
    bool overflowed_ = false;
    std::string text_;
};

}  // namespace codetutor::sandbox
