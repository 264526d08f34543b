#include <cfgref/core/terminal.hpp>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <string>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace cfgref {

std::optional<ColorMode> ParseColorMode(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "auto") return ColorMode::Auto;
    if (lowered == "always" || lowered == "true") return ColorMode::Always;
    if (lowered == "never" || lowered == "false") return ColorMode::Never;
    return std::nullopt;
}

bool IsTty(TerminalStream stream) {
#ifdef _WIN32
    auto* handle = stream == TerminalStream::Stdout ? stdout : stderr;
    return _isatty(_fileno(handle)) != 0;
#else
    return isatty(stream == TerminalStream::Stdout ? STDOUT_FILENO
                                                   : STDERR_FILENO) != 0;
#endif
}

bool NoColorEnvSet() {
    return std::getenv("NO_COLOR") != nullptr;
}

bool UseColor(ColorMode mode, TerminalStream stream) {
    if (mode == ColorMode::Never || NoColorEnvSet()) {
        return false;
    }
    if (mode == ColorMode::Always) {
        return true;
    }
    return IsTty(stream);
}

} // namespace cfgref
