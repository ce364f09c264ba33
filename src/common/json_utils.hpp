#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace bootverdict {

inline std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

inline std::string toTargetString(Target target)
{
    switch (target) {
    case Target::Amd64:
        return "amd64";
    case Target::Arm64:
        return "arm64";
    case Target::Riscv64:
        return "riscv64";
    }
    return "amd64";
}

// Unknown architectures are a caller error, so there is no fallback value.
inline std::optional<Target> parseTargetString(const std::string &value)
{
    if (value == "amd64") {
        return Target::Amd64;
    }
    if (value == "arm64") {
        return Target::Arm64;
    }
    if (value == "riscv64") {
        return Target::Riscv64;
    }
    return std::nullopt;
}

inline std::vector<Target> allTargets()
{
    return {Target::Amd64, Target::Arm64, Target::Riscv64};
}

inline std::string toCheckKey(CheckId id)
{
    switch (id) {
    case CheckId::KernelLoaded:
        return "kernel_loaded";
    case CheckId::InitramfsLoaded:
        return "initramfs_loaded";
    case CheckId::InstallerStarted:
        return "installer_started";
    case CheckId::NoPanic:
        return "no_panic";
    case CheckId::ReachedShell:
        return "reached_shell";
    }
    return "kernel_loaded";
}

inline std::optional<CheckId> parseCheckKey(const std::string &value)
{
    if (value == "kernel_loaded") {
        return CheckId::KernelLoaded;
    }
    if (value == "initramfs_loaded") {
        return CheckId::InitramfsLoaded;
    }
    if (value == "installer_started") {
        return CheckId::InstallerStarted;
    }
    if (value == "no_panic") {
        return CheckId::NoPanic;
    }
    if (value == "reached_shell") {
        return CheckId::ReachedShell;
    }
    return std::nullopt;
}

inline std::string toPolarityString(CheckPolarity polarity)
{
    switch (polarity) {
    case CheckPolarity::RequirePresent:
        return "present";
    case CheckPolarity::RequireAbsent:
        return "absent";
    }
    return "present";
}

inline std::string toOutcomeString(OutcomeKind kind)
{
    switch (kind) {
    case OutcomeKind::Classified:
        return "classified";
    case OutcomeKind::Indeterminate:
        return "indeterminate";
    }
    return "indeterminate";
}

inline void to_json(nlohmann::json &j, const Target &target)
{
    j = toTargetString(target);
}

inline void from_json(const nlohmann::json &j, Target &target)
{
    std::optional<Target> parsed;
    if (j.is_string()) {
        parsed = parseTargetString(j.get<std::string>());
    }
    target = parsed.value_or(Target::Amd64);
}

inline void to_json(nlohmann::json &j, const CheckId &id)
{
    j = toCheckKey(id);
}

inline void from_json(const nlohmann::json &j, CheckId &id)
{
    std::optional<CheckId> parsed;
    if (j.is_string()) {
        parsed = parseCheckKey(j.get<std::string>());
    }
    id = parsed.value_or(CheckId::KernelLoaded);
}

inline void to_json(nlohmann::json &j, const CheckDefinition &definition)
{
    j = nlohmann::json{
        {"id", definition.id},
        {"label", definition.label},
        {"polarity", toPolarityString(definition.polarity)},
        {"patterns", definition.patterns}
    };
}

inline void to_json(nlohmann::json &j, const CheckResult &result)
{
    j = nlohmann::json{
        {"id", result.id},
        {"label", result.label},
        {"passed", result.passed},
        {"matchedPattern", result.matchedPattern}
    };
}

inline void from_json(const nlohmann::json &j, CheckResult &result)
{
    result.id = j.value("id", CheckId::KernelLoaded);
    result.label = j.value("label", "");
    result.passed = j.value("passed", false);
    result.matchedPattern = j.value("matchedPattern", "");
}

// passed/total/success are written for consumers but recomputed on read.
inline void to_json(nlohmann::json &j, const Verdict &verdict)
{
    j = nlohmann::json{
        {"target", verdict.target},
        {"passed", verdict.passedCount()},
        {"total", verdict.totalCount()},
        {"success", verdict.passed()},
        {"checks", verdict.checks}
    };
}

inline void from_json(const nlohmann::json &j, Verdict &verdict)
{
    verdict.target = j.value("target", Target::Amd64);
    if (j.contains("checks") && j.at("checks").is_array()) {
        verdict.checks = j.at("checks").get<std::vector<CheckResult>>();
    } else {
        verdict.checks.clear();
    }
}

inline void to_json(nlohmann::json &j, const TargetOutcome &outcome)
{
    j = nlohmann::json{
        {"target", outcome.target},
        {"outcome", toOutcomeString(outcome.kind)},
        {"transcriptPath", outcome.transcriptPath},
        {"errorMarkersSeen", outcome.errorMarkersSeen}
    };
    if (!outcome.reason.empty()) {
        j["reason"] = outcome.reason;
    }
    if (outcome.verdict.has_value()) {
        j["verdict"] = *outcome.verdict;
    } else {
        j["verdict"] = nullptr;
    }
}

inline void to_json(nlohmann::json &j, const OutcomeSummary &summary)
{
    j = nlohmann::json{
        {"total", summary.total},
        {"passed", summary.passed},
        {"failed", summary.failed},
        {"indeterminate", summary.indeterminate}
    };
}

} // namespace bootverdict
