#include "utils/ansi.hpp"

namespace tfb_toolset {

namespace {

constexpr char kEsc = '\x1b';
constexpr char kBel = '\x07';

bool isControl(unsigned char c) {
    return (c < 0x20 && c != '\t' && c != '\n') || c == 0x7f;
}

// Index just past a CSI sequence starting at pos ("ESC [" already consumed)
size_t skipCsi(std::string_view text, size_t pos) {
    while (pos < text.size()) {
        unsigned char c = static_cast<unsigned char>(text[pos++]);
        if (c >= 0x40 && c <= 0x7e) {
            break;
        }
    }
    return pos;
}

// OSC is terminated by BEL or ST ("ESC \")
size_t skipOsc(std::string_view text, size_t pos) {
    while (pos < text.size()) {
        char c = text[pos++];
        if (c == kBel) {
            break;
        }
        if (c == kEsc && pos < text.size() && text[pos] == '\\') {
            ++pos;
            break;
        }
    }
    return pos;
}

} // namespace

std::string stylize(std::string_view text, const fmt::text_style& ts) {
    return fmt::format(ts, "{}", text);
}

std::string stripAnsi(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        char c = text[i];
        if (c != kEsc) {
            if (!isControl(static_cast<unsigned char>(c))) {
                out.push_back(c);
            }
            ++i;
            continue;
        }

        ++i;
        if (i >= text.size()) {
            break;
        }

        char kind = text[i++];
        if (kind == '[') {
            i = skipCsi(text, i);
        } else if (kind == ']') {
            i = skipOsc(text, i);
        } else {
            // Intermediate bytes (e.g. "ESC ( B") precede the final byte
            while (i < text.size() && kind >= 0x20 && kind <= 0x2f) {
                kind = text[i++];
            }
        }
    }

    return out;
}

} // namespace tfb_toolset
