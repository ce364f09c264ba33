#pragma once

#include <string>

namespace bootverdict {

enum class Severity {
    Info,
    Warn,
    Error,
    Test
};

// "[INFO] text", wrapped in ANSI color codes when color is true.
std::string styleLine(Severity severity, const std::string &text, bool color);

std::string severityTag(Severity severity);

} // namespace bootverdict
