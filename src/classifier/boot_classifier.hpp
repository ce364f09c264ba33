#pragma once

#include <optional>
#include <string>

#include "common/models.hpp"

namespace bootverdict {

class BootClassifier
{
public:
    // Evaluates every check of the catalog against the transcript, in catalog
    // order. Pure: the same input always yields the same verdict.
    static Verdict classify(const Transcript &transcript, const CheckCatalog &catalog);

    // Wraps classify() for one target. An absent transcript becomes an
    // Indeterminate outcome instead of a verdict with every check failed.
    static TargetOutcome classifyTarget(Target target,
                                        const std::optional<Transcript> &transcript,
                                        const CheckCatalog &catalog,
                                        const std::string &transcriptPath = std::string());

    // True when "panic" or "error" appears anywhere, case-insensitively.
    static bool containsErrorMarkers(const Transcript &transcript);
};

} // namespace bootverdict
