#pragma once

#include <optional>

#include <QString>
#include <QStringList>

#include "common/models.hpp"

namespace bootverdict {

// <dir>/qemu-<arch>-boot.log, the name the QEMU runner tees the serial console to.
QString transcriptPathFor(const QString &transcriptDir, Target target);

/**
 * Read a boot transcript from disk.
 *
 * Returns std::nullopt when the path does not exist, is not a regular file or
 * cannot be opened; the classifier reports those targets as indeterminate.
 * Content is taken as raw bytes, so binary noise on the serial line is kept.
 */
std::optional<Transcript> loadTranscript(const QString &path, Target target);

// Lines of the transcript with trailing '\r' removed.
QStringList transcriptLines(const Transcript &transcript);

// First line containing the pattern (case-insensitive), or an empty string.
QString firstLineMatching(const Transcript &transcript, const QString &pattern);

} // namespace bootverdict
