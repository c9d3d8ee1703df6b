#ifndef ANSI_HPP
#define ANSI_HPP

#include <fmt/color.h>
#include <string>
#include <string_view>

namespace tfb_toolset {

// Console styles. Cyan marks structure and banners, red errors,
// yellow warnings, green passes.
namespace style {
inline const fmt::text_style kPrefix = fmt::fg(fmt::terminal_color::white) | fmt::emphasis::bold;
inline const fmt::text_style kStructure = fmt::fg(fmt::terminal_color::cyan);
inline const fmt::text_style kError = fmt::fg(fmt::terminal_color::red);
inline const fmt::text_style kWarning = fmt::fg(fmt::terminal_color::yellow);
inline const fmt::text_style kPass = fmt::fg(fmt::terminal_color::green);
} // namespace style

// Wrap text in the escape sequences for the given style
std::string stylize(std::string_view text, const fmt::text_style& ts);

// Remove ANSI escape sequences (CSI, OSC and two-byte escapes) and
// non-printing control bytes other than tab and newline
std::string stripAnsi(std::string_view text);

} // namespace tfb_toolset

#endif // ANSI_HPP
