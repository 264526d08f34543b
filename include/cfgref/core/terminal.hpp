#pragma once

#include <optional>
#include <string_view>

namespace cfgref {

namespace ansi {

constexpr const char* kReset  = "\033[0m";
constexpr const char* kBold   = "\033[1m";
constexpr const char* kDim    = "\033[90m";
constexpr const char* kRed    = "\033[1;31m";
constexpr const char* kGreen  = "\033[1;32m";
constexpr const char* kYellow = "\033[33m";
constexpr const char* kCyan   = "\033[36m";

} // namespace ansi

enum class ColorMode {
    Auto,
    Always,
    Never,
};

enum class TerminalStream {
    Stdout,
    Stderr,
};

// "auto", "always"/"true", "never"/"false".
std::optional<ColorMode> ParseColorMode(std::string_view name);

/// Returns true if the stream is connected to a terminal.
bool IsTty(TerminalStream stream);

/// Returns true if the NO_COLOR environment variable is set (https://no-color.org/).
bool NoColorEnvSet();

/// Decide whether to emit ANSI colors on a stream. NO_COLOR beats Auto
/// and Always; Never always wins.
bool UseColor(ColorMode mode, TerminalStream stream);

} // namespace cfgref
