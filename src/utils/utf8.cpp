#include "utils/utf8.hpp"

namespace codetutor::utils {
namespace {

std::size_t SequenceLength(unsigned char lead) {
    if (lead < 0x80) {
        return 1;
    }
    if ((lead & 0xE0) == 0xC0) {
        return 2;
    }
    if ((lead & 0xF0) == 0xE0) {
        return 3;
    }
    if ((lead & 0xF8) == 0xF0) {
        return 4;
    }
    return 1;
}

bool IsContinuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

// Length of the well-formed sequence at `pos`, or 1 for a stray byte.
std::size_t StepAt(const std::string& text, std::size_t pos) {
    const auto length = SequenceLength(static_cast<unsigned char>(text[pos]));
    if (length == 1 || pos + length > text.size()) {
        return 1;
    }
    for (std::size_t i = 1; i < length; ++i) {
        if (!IsContinuation(static_cast<unsigned char>(text[pos + i]))) {
            return 1;
        }
    }
    return length;
}

}  // namespace

std::size_t Utf8Length(const std::string& text) {
    std::size_t count = 0;
    std::size_t pos = 0;
    while (pos < text.size()) {
        pos += StepAt(text, pos);
        ++count;
    }
    return count;
}

std::size_t Utf8Offset(const std::string& text, std::size_t index) {
    std::size_t pos = 0;
    std::size_t count = 0;
    while (pos < text.size() && count < index) {
        pos += StepAt(text, pos);
        ++count;
    }
    return pos;
}

std::string Utf8Prefix(const std::string& text, std::size_t count) {
    return text.substr(0, Utf8Offset(text, count));
}

std::vector<char32_t> Utf8Decode(const std::string& text) {
    std::vector<char32_t> result;
    result.reserve(text.size());
    std::size_t pos = 0;
    while (pos < text.size()) {
        const auto step = StepAt(text, pos);
        const auto lead = static_cast<unsigned char>(text[pos]);
        char32_t cp = 0;
        switch (step) {
            case 1:
                cp = lead;
                break;
            case 2:
                cp = static_cast<char32_t>(lead & 0x1F);
                break;
            case 3:
                cp = static_cast<char32_t>(lead & 0x0F);
                break;
            default:
                cp = static_cast<char32_t>(lead & 0x07);
                break;
        }
        for (std::size_t i = 1; i < step; ++i) {
            cp = (cp << 6) | static_cast<char32_t>(static_cast<unsigned char>(text[pos + i]) & 0x3F);
        }
        result.push_back(cp);
        pos += step;
    }
    return result;
}

std::string Utf8Encode(char32_t cp) {
    std::string out;
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    return out;
}

std::string Utf8Encode(const std::vector<char32_t>& code_points) {
    std::string out;
    out.reserve(code_points.size());
    for (const auto cp : code_points) {
        out += Utf8Encode(cp);
    }
    return out;
}

bool IsAscii(const std::string& text) {
    for (const auto c : text) {
        if (static_cast<unsigned char>(c) >= 0x80) {
            return false;
        }
    }
    return true;
}

}  // namespace codetutor::utils
