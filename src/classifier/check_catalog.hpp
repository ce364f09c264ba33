#pragma once

#include <optional>

#include <QString>

#include "common/models.hpp"

namespace bootverdict {

// The five boot checks in display order, with the patterns the installer
// validation has always used.
CheckCatalog defaultCheckCatalog();

/**
 * Load pattern overrides from a JSON file of the form
 *   {"checks": {"installer_started": {"patterns": ["rustica os installer"]}}}
 * and apply them to the default catalog.
 *
 * Only patterns can be replaced; labels, polarity and order stay fixed so the
 * catalog always has exactly five checks. Returns std::nullopt and fills
 * errorMessage when the file is unreadable or malformed.
 */
std::optional<CheckCatalog> loadCheckCatalog(const QString &path, QString *errorMessage);

const CheckDefinition *findCheck(const CheckCatalog &catalog, CheckId id);

} // namespace bootverdict
