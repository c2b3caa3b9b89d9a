#include "sandbox/output_capture.hpp"

#include "utils/utf8.hpp"

namespace codetutor::sandbox {

OutputCapture::OutputCapture(std::size_t limit)
    : limit_(limit) {}

void OutputCapture::Write(const std::string& text) {
    if (text.empty()) {
        return;
    }
    if (length_ >= limit_) {
        overflowed_ = true;
        return;
    }
    const auto room = limit_ - length_;
    const auto count = utils::Utf8Length(text);
    if (count <= room) {
        text_ += text;
        length_ += count;
        return;
    }
    text_ += utils::Utf8Prefix(text, room);
    length_ = limit_;
    overflowed_ = true;
}

}  // namespace codetutor::sandbox
