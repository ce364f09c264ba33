#include "classifier/transcript_loader.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>

#include "common/json_utils.hpp"

namespace bootverdict {

QString transcriptPathFor(const QString &transcriptDir, Target target)
{
    const QString fileName = QStringLiteral("qemu-%1-boot.log")
                                 .arg(QString::fromStdString(toTargetString(target)));
    return QDir(transcriptDir).filePath(fileName);
}

std::optional<Transcript> loadTranscript(const QString &path, Target target)
{
    const QFileInfo info(path);
    if (!info.exists() || !info.isFile()) {
        return std::nullopt;
    }

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return std::nullopt;
    }

    const QByteArray data = file.readAll();

    Transcript transcript;
    transcript.target = target;
    transcript.text = std::string(data.constData(), static_cast<size_t>(data.size()));
    transcript.sourcePath = path.toStdString();
    return transcript;
}

QStringList transcriptLines(const Transcript &transcript)
{
    const QString text = QString::fromUtf8(transcript.text.data(),
                                           static_cast<qsizetype>(transcript.text.size()));
    QStringList lines = text.split(QLatin1Char('\n'));
    if (!lines.isEmpty() && lines.back().isEmpty()) {
        lines.removeLast();
    }
    for (auto &line : lines) {
        if (line.endsWith(QLatin1Char('\r'))) {
            line.chop(1);
        }
    }
    return lines;
}

QString firstLineMatching(const Transcript &transcript, const QString &pattern)
{
    if (pattern.isEmpty()) {
        return {};
    }
    for (const QString &line : transcriptLines(transcript)) {
        if (line.contains(pattern, Qt::CaseInsensitive)) {
            return line.trimmed();
        }
    }
    return {};
}

} // namespace bootverdict
