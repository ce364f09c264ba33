#include "common/console_style.hpp"

namespace bootverdict {

namespace {

constexpr const char *kReset = "\033[0m";

const char *severityColor(Severity severity)
{
    switch (severity) {
    case Severity::Info:
        return "\033[0;32m";
    case Severity::Warn:
        return "\033[1;33m";
    case Severity::Error:
        return "\033[0;31m";
    case Severity::Test:
        return "\033[0;34m";
    }
    return "";
}

} // namespace

std::string severityTag(Severity severity)
{
    switch (severity) {
    case Severity::Info:
        return "[INFO]";
    case Severity::Warn:
        return "[WARN]";
    case Severity::Error:
        return "[ERROR]";
    case Severity::Test:
        return "[TEST]";
    }
    return "[INFO]";
}

std::string styleLine(Severity severity, const std::string &text, bool color)
{
    if (!color) {
        return severityTag(severity) + " " + text;
    }
    return std::string(severityColor(severity)) + severityTag(severity) + kReset
        + " " + text;
}

} // namespace bootverdict
