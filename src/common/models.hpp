#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "common/enums.hpp"

namespace bootverdict {

struct Transcript {
    Target target = Target::Amd64;
    std::string text;
    std::string sourcePath;
};

struct CheckDefinition {
    CheckId id = CheckId::KernelLoaded;
    std::string label;
    std::vector<std::string> patterns;
    CheckPolarity polarity = CheckPolarity::RequirePresent;
    std::string passMessage;
    std::string failMessage;
};

using CheckCatalog = std::vector<CheckDefinition>;

struct CheckResult {
    CheckId id = CheckId::KernelLoaded;
    std::string label;
    bool passed = false;
    // First pattern found in the transcript, empty when nothing matched.
    std::string matchedPattern;
};

struct Verdict {
    Target target = Target::Amd64;
    std::vector<CheckResult> checks;

    std::size_t totalCount() const { return checks.size(); }

    std::size_t passedCount() const
    {
        std::size_t count = 0;
        for (const auto &check : checks) {
            if (check.passed) {
                ++count;
            }
        }
        return count;
    }

    // Overall success is derived from the per-check results, never stored.
    bool passed() const { return passedCount() == totalCount(); }
};

struct TargetOutcome {
    Target target = Target::Amd64;
    OutcomeKind kind = OutcomeKind::Indeterminate;
    std::string transcriptPath;
    std::string reason;
    // Set iff kind == OutcomeKind::Classified.
    std::optional<Verdict> verdict;
    // "panic" or "error" seen anywhere; informational only.
    bool errorMarkersSeen = false;

    bool isIndeterminate() const { return kind == OutcomeKind::Indeterminate; }
    bool passed() const { return verdict.has_value() && verdict->passed(); }
};

struct OutcomeSummary {
    std::size_t total = 0;
    std::size_t passed = 0;
    std::size_t failed = 0;
    std::size_t indeterminate = 0;
};

} // namespace bootverdict
