#include "classifier/boot_classifier.hpp"

#include <cctype>

namespace bootverdict {

namespace {

std::string toLowerAscii(std::string value)
{
    for (auto &ch : value) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return value;
}

// Returns the first pattern of the list found in the lowered text.
std::optional<std::string> findFirstPattern(const std::string &loweredText,
                                            const std::vector<std::string> &patterns)
{
    for (const auto &pattern : patterns) {
        if (pattern.empty()) {
            continue;
        }
        if (loweredText.find(toLowerAscii(pattern)) != std::string::npos) {
            return pattern;
        }
    }
    return std::nullopt;
}

} // namespace

Verdict BootClassifier::classify(const Transcript &transcript, const CheckCatalog &catalog)
{
    Verdict verdict;
    verdict.target = transcript.target;
    verdict.checks.reserve(catalog.size());

    const std::string lowered = toLowerAscii(transcript.text);

    for (const auto &check : catalog) {
        const auto match = findFirstPattern(lowered, check.patterns);

        CheckResult result;
        result.id = check.id;
        result.label = check.label;
        if (match.has_value()) {
            result.matchedPattern = *match;
        }

        // Absent-polarity checks pass on no evidence, so an empty transcript
        // passes them.
        if (check.polarity == CheckPolarity::RequireAbsent) {
            result.passed = !match.has_value();
        } else {
            result.passed = match.has_value();
        }

        verdict.checks.push_back(std::move(result));
    }

    return verdict;
}

TargetOutcome BootClassifier::classifyTarget(Target target,
                                             const std::optional<Transcript> &transcript,
                                             const CheckCatalog &catalog,
                                             const std::string &transcriptPath)
{
    TargetOutcome outcome;
    outcome.target = target;
    outcome.transcriptPath = transcriptPath;

    if (!transcript.has_value()) {
        outcome.kind = OutcomeKind::Indeterminate;
        outcome.reason = "no transcript captured";
        return outcome;
    }

    if (outcome.transcriptPath.empty()) {
        outcome.transcriptPath = transcript->sourcePath;
    }

    Transcript scoped = *transcript;
    scoped.target = target;

    outcome.kind = OutcomeKind::Classified;
    outcome.verdict = classify(scoped, catalog);
    outcome.errorMarkersSeen = containsErrorMarkers(scoped);
    return outcome;
}

bool BootClassifier::containsErrorMarkers(const Transcript &transcript)
{
    const std::string lowered = toLowerAscii(transcript.text);
    return lowered.find("panic") != std::string::npos
        || lowered.find("error") != std::string::npos;
}

} // namespace bootverdict
