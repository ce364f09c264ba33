#include "report/ReportRenderer.hpp"

#include <chrono>
#include <sstream>

#include <QSysInfo>

#include "classifier/check_catalog.hpp"
#include "common/console_style.hpp"
#include "common/json_utils.hpp"

namespace bootverdict {

namespace {

std::string resultLabel(const TargetOutcome &outcome)
{
    if (outcome.isIndeterminate()) {
        return "NO DATA";
    }
    return outcome.passed() ? "PASS" : "FAIL";
}

std::string countLabel(const TargetOutcome &outcome)
{
    if (!outcome.verdict.has_value()) {
        return "-";
    }
    return std::to_string(outcome.verdict->passedCount()) + "/"
        + std::to_string(outcome.verdict->totalCount());
}

Severity failureSeverity(const CheckResult &result)
{
    // A panic is reported as an error, any other missing marker as a warning.
    return result.id == CheckId::NoPanic ? Severity::Error : Severity::Warn;
}

} // namespace

ReportMeta currentReportMeta()
{
    ReportMeta meta;
    meta.generatedAt = toIso8601Utc(std::chrono::system_clock::now());
    meta.host = QSysInfo::machineHostName().toStdString();
    meta.hostArchitecture = QSysInfo::currentCpuArchitecture().toStdString();
    return meta;
}

OutcomeSummary summarize(const std::vector<TargetOutcome> &outcomes)
{
    OutcomeSummary summary;
    summary.total = outcomes.size();
    for (const auto &outcome : outcomes) {
        if (outcome.isIndeterminate()) {
            ++summary.indeterminate;
        } else if (outcome.passed()) {
            ++summary.passed;
        } else {
            ++summary.failed;
        }
    }
    return summary;
}

ReportRenderer::ReportRenderer(const CheckCatalog &catalog)
    : m_catalog(catalog)
{
}

std::string ReportRenderer::checkMessage(const CheckResult &result) const
{
    const CheckDefinition *definition = findCheck(m_catalog, result.id);
    if (!definition) {
        return result.label;
    }
    return result.passed ? definition->passMessage : definition->failMessage;
}

std::string ReportRenderer::renderConsole(const std::vector<TargetOutcome> &outcomes,
                                          bool color) const
{
    std::ostringstream out;

    for (const auto &outcome : outcomes) {
        const std::string arch = toTargetString(outcome.target);
        out << styleLine(Severity::Test, "Analyzing boot log for " + arch + "...", color)
            << "\n";

        if (!outcome.verdict.has_value()) {
            out << styleLine(Severity::Error,
                             "Boot log not found for " + arch + " (" + outcome.transcriptPath + ")",
                             color)
                << "\n";
            out << styleLine(Severity::Error, "? Indeterminate: " + outcome.reason, color)
                << "\n\n";
            continue;
        }

        const Verdict &verdict = *outcome.verdict;
        for (const auto &check : verdict.checks) {
            if (check.passed) {
                out << styleLine(Severity::Info, "✓ " + checkMessage(check), color) << "\n";
            } else {
                out << styleLine(failureSeverity(check), "✗ " + checkMessage(check), color)
                    << "\n";
            }
        }

        out << "\n";
        out << styleLine(Severity::Info,
                         "Test Results: " + countLabel(outcome) + " checks passed", color)
            << "\n";
        if (verdict.passed()) {
            out << styleLine(Severity::Info, "✓ All checks passed for " + arch, color)
                << "\n\n";
        } else {
            out << styleLine(Severity::Warn, "⚠ Some checks failed for " + arch, color)
                << "\n\n";
        }
    }

    const OutcomeSummary summary = summarize(outcomes);
    const Severity severity = summary.failed > 0
        ? Severity::Warn
        : (summary.indeterminate > 0 ? Severity::Error : Severity::Info);
    out << styleLine(severity,
                     "Summary: " + std::to_string(summary.passed) + " passed, "
                         + std::to_string(summary.failed) + " failed, "
                         + std::to_string(summary.indeterminate) + " indeterminate ("
                         + std::to_string(summary.total) + " targets)",
                     color)
        << "\n";

    return out.str();
}

std::string ReportRenderer::renderMarkdown(const std::vector<TargetOutcome> &outcomes,
                                           const ReportMeta &meta) const
{
    std::ostringstream out;
    out << "# Rustica OS Installer Test Report\n\n";
    out << "Test Date: " << meta.generatedAt << "\n";
    out << "Test Host: " << meta.host << "\n\n";

    out << "## Overview\n\n";
    if (outcomes.empty()) {
        out << "No targets were analyzed.\n\n";
    } else {
        out << "| Target | Result | Checks |\n";
        out << "|--------|--------|--------|\n";
        for (const auto &outcome : outcomes) {
            out << "| " << toTargetString(outcome.target) << " | " << resultLabel(outcome)
                << " | " << countLabel(outcome) << " |\n";
        }
        out << "\n";
    }

    for (const auto &outcome : outcomes) {
        out << "## " << toTargetString(outcome.target) << "\n\n";

        if (!outcome.verdict.has_value()) {
            out << "Boot Log: " << outcome.transcriptPath << " (not found)\n\n";
            out << "Result: NO DATA (" << outcome.reason << ")\n\n";
            continue;
        }

        out << "Boot Log: " << outcome.transcriptPath << "\n\n";
        for (const auto &check : outcome.verdict->checks) {
            out << "- " << (check.passed ? "✓ " : "✗ ") << checkMessage(check) << "\n";
        }
        out << "\n";
        out << "Result: " << resultLabel(outcome) << " (" << countLabel(outcome)
            << " checks passed)\n";
        if (outcome.errorMarkersSeen) {
            out << "Status: ⚠ Errors detected\n\n";
        } else {
            out << "Status: ✓ No critical errors\n\n";
        }
    }

    out << "## Next Steps\n\n";
    out << "- Review the boot logs listed above\n";
    out << "- Run interactive QEMU tests for detailed debugging\n";
    out << "- Test automated installation sequence\n\n";

    out << "## Test Environment\n\n";
    out << "- Architecture: " << meta.hostArchitecture << "\n";

    return out.str();
}

nlohmann::json ReportRenderer::renderJson(const std::vector<TargetOutcome> &outcomes,
                                          const ReportMeta &meta) const
{
    nlohmann::json payload;
    payload["generatedAt"] = meta.generatedAt;
    payload["host"] = meta.host;
    payload["summary"] = summarize(outcomes);
    payload["targets"] = outcomes;
    return payload;
}

} // namespace bootverdict
