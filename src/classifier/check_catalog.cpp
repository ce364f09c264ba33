#include "classifier/check_catalog.hpp"

#include <string>
#include <vector>

#include <QFile>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"

namespace bootverdict {

namespace {

void setError(QString *errorMessage, const QString &message)
{
    if (errorMessage) {
        *errorMessage = message;
    }
}

} // namespace

CheckCatalog defaultCheckCatalog()
{
    return {
        {CheckId::KernelLoaded,
         "Kernel loaded",
         {"loading kernel"},
         CheckPolarity::RequirePresent,
         "Kernel loaded",
         "Kernel load not detected"},
        {CheckId::InitramfsLoaded,
         "Initramfs loaded",
         {"loading initramfs", "initrd"},
         CheckPolarity::RequirePresent,
         "Initramfs loaded",
         "Initramfs load not detected"},
        {CheckId::InstallerStarted,
         "Installer started",
         {"rustica os installer", "installer"},
         CheckPolarity::RequirePresent,
         "Installer detected",
         "Installer not detected"},
        {CheckId::NoPanic,
         "No kernel panic",
         {"kernel panic", "panic"},
         CheckPolarity::RequireAbsent,
         "No kernel panics",
         "Kernel panic detected"},
        {CheckId::ReachedShell,
         "Reached shell",
         {"root@", "login", "shell"},
         CheckPolarity::RequirePresent,
         "System reached shell/login",
         "System did not reach shell"},
    };
}

const CheckDefinition *findCheck(const CheckCatalog &catalog, CheckId id)
{
    for (const auto &check : catalog) {
        if (check.id == id) {
            return &check;
        }
    }
    return nullptr;
}

std::optional<CheckCatalog> loadCheckCatalog(const QString &path, QString *errorMessage)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        setError(errorMessage, QStringLiteral("Cannot open check catalog: %1").arg(path));
        return std::nullopt;
    }

    nlohmann::json root;
    try {
        root = nlohmann::json::parse(file.readAll().toStdString());
    } catch (const nlohmann::json::parse_error &ex) {
        setError(errorMessage, QStringLiteral("Invalid check catalog JSON: %1")
                                   .arg(QString::fromUtf8(ex.what())));
        return std::nullopt;
    }

    if (!root.is_object() || !root.contains("checks") || !root.at("checks").is_object()) {
        setError(errorMessage, QStringLiteral("Check catalog must contain a \"checks\" object."));
        return std::nullopt;
    }

    CheckCatalog catalog = defaultCheckCatalog();
    for (const auto &[key, entry] : root.at("checks").items()) {
        const auto id = parseCheckKey(key);
        if (!id.has_value()) {
            setError(errorMessage, QStringLiteral("Unknown check: %1")
                                       .arg(QString::fromStdString(key)));
            return std::nullopt;
        }

        if (!entry.is_object() || !entry.contains("patterns")
            || !entry.at("patterns").is_array() || entry.at("patterns").empty()) {
            setError(errorMessage, QStringLiteral("Check %1 needs a non-empty \"patterns\" array.")
                                       .arg(QString::fromStdString(key)));
            return std::nullopt;
        }

        std::vector<std::string> patterns;
        for (const auto &pattern : entry.at("patterns")) {
            if (!pattern.is_string() || pattern.get<std::string>().empty()) {
                setError(errorMessage, QStringLiteral("Check %1 has an empty or non-string pattern.")
                                           .arg(QString::fromStdString(key)));
                return std::nullopt;
            }
            patterns.push_back(pattern.get<std::string>());
        }

        for (auto &check : catalog) {
            if (check.id == *id) {
                check.patterns = std::move(patterns);
                break;
            }
        }
    }

    return catalog;
}

} // namespace bootverdict
