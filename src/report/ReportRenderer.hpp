#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace bootverdict {

struct ReportMeta {
    std::string generatedAt;
    std::string host;
    std::string hostArchitecture;
};

// Current UTC time, machine hostname and CPU architecture.
ReportMeta currentReportMeta();

OutcomeSummary summarize(const std::vector<TargetOutcome> &outcomes);

class ReportRenderer
{
public:
    explicit ReportRenderer(const CheckCatalog &catalog);

    // Per-check console lines in the [INFO]/[WARN]/[ERROR] style of the
    // validation scripts, followed by a one-line summary.
    std::string renderConsole(const std::vector<TargetOutcome> &outcomes, bool color) const;

    // Test report document: overview table, one section per target.
    std::string renderMarkdown(const std::vector<TargetOutcome> &outcomes,
                               const ReportMeta &meta) const;

    nlohmann::json renderJson(const std::vector<TargetOutcome> &outcomes,
                              const ReportMeta &meta) const;

private:
    std::string checkMessage(const CheckResult &result) const;

    CheckCatalog m_catalog;
};

} // namespace bootverdict
