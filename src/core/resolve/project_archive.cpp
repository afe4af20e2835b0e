#include "project_archive.h"
#include "sequence_document.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QProcess>
#include <QProcessEnvironment>
#include <QRegularExpression>
#include <QStandardPaths>

Q_LOGGING_CATEGORY(jlcArchive, "jlc.resolve.archive")

namespace JLC {

namespace {

bool isUnsafeEntryPath(const QString& path)
{
    if (path.startsWith(QLatin1Char('/')) || path.startsWith(QLatin1Char('\\'))) {
        return true;
    }
    // Windows drive prefix such as "C:"
    if (path.size() >= 2 && path.at(1) == QLatin1Char(':')) {
        return true;
    }

    const QStringList segments = path.split(QRegularExpression(QStringLiteral("[/\\\\]")));
    return segments.contains(QStringLiteral(".."));
}

} // namespace

ProjectArchive::ProjectArchive(const ArchiveLimits& limits)
    : m_limits(limits)
{
}

QString ProjectArchive::missingTool()
{
    for (const char* tool : {cutconst::UNZIP_TOOL, cutconst::ZIP_TOOL}) {
        if (QStandardPaths::findExecutable(QLatin1String(tool)).isEmpty()) {
            return QLatin1String(tool);
        }
    }
    return QString();
}

QString ProjectArchive::outputName(const QString& inputPath, CutMode mode)
{
    const QFileInfo input(inputPath);
    const char* suffix = mode == CutMode::J ? cutconst::J_CUT_OUTPUT_SUFFIX : cutconst::L_CUT_OUTPUT_SUFFIX;
    const QString extension = input.suffix().isEmpty() ? QLatin1String(cutconst::PROJECT_ARCHIVE_SUFFIX)
                                                       : input.suffix();
    return QStringLiteral("%1%2.%3").arg(input.completeBaseName(), QLatin1String(suffix), extension);
}

Result<QList<ArchiveEntry>> ProjectArchive::parseListing(const QString& listing)
{
    // Entries sit between the first two dashed rule lines:
    //   "   Length      Date    Time    Name"
    //   "---------  ---------- -----   ----"
    //   "      123  2024-01-01 12:00   project.xml"
    //   "---------                     -------"
    static const QRegularExpression rule(QStringLiteral("^\\s*-{4,}"));
    static const QRegularExpression row(QStringLiteral("^\\s*(\\d+)\\s+\\S+\\s+\\S+\\s+(.+)$"));

    QList<ArchiveEntry> entries;
    int rulesSeen = 0;
    const QStringList lines = listing.split(QLatin1Char('\n'));
    for (const QString& line : lines) {
        if (line.trimmed().isEmpty()) {
            continue;
        }
        if (rule.match(line).hasMatch()) {
            ++rulesSeen;
            if (rulesSeen == 2) {
                break;
            }
            continue;
        }
        if (rulesSeen != 1) {
            continue;
        }

        const QRegularExpressionMatch match = row.match(line);
        if (!match.hasMatch()) {
            return Error::invalid_archive(QStringLiteral("Unrecognised archive listing line: %1").arg(line.trimmed()));
        }

        ArchiveEntry entry;
        entry.size = match.captured(1).toLongLong();
        entry.path = match.captured(2);
        if (entry.path.endsWith(QLatin1Char('\r'))) {
            entry.path.chop(1);
        }
        entries.append(entry);
    }

    if (rulesSeen < 2) {
        return Error::invalid_archive(QStringLiteral("Archive listing is incomplete"));
    }
    return entries;
}

Result<void> ProjectArchive::validateEntries(const QList<ArchiveEntry>& entries, const ArchiveLimits& limits)
{
    // Algorithm: Sum sizes → Check each path → Require manifest
    qint64 total = 0;
    bool hasManifest = false;
    for (const ArchiveEntry& entry : entries) {
        total += entry.size;
        if (isUnsafeEntryPath(entry.path)) {
            return Error::invalid_archive(QStringLiteral("Invalid file path in archive: %1").arg(entry.path));
        }
        if (entry.path == QLatin1String(cutconst::PROJECT_MANIFEST_FILE)) {
            hasManifest = true;
        }
    }

    if (total > limits.maxExtractedBytes) {
        return Error::invalid_archive(QStringLiteral("Extracted size (%1 bytes) exceeds maximum (%2 bytes)")
                                          .arg(QString::number(total), QString::number(limits.maxExtractedBytes)));
    }
    if (!hasManifest) {
        return Error::invalid_archive(QStringLiteral("Invalid project structure: missing %1")
                                          .arg(QLatin1String(cutconst::PROJECT_MANIFEST_FILE)));
    }
    return Result<void>();
}

Result<void> ProjectArchive::verifyLayout(const QString& directory)
{
    const QDir root(directory);
    if (!QFileInfo(root.filePath(QLatin1String(cutconst::PROJECT_MANIFEST_FILE))).isFile()) {
        return Error::invalid_archive(QStringLiteral("Invalid project structure: missing %1")
                                          .arg(QLatin1String(cutconst::PROJECT_MANIFEST_FILE)));
    }
    if (!QFileInfo(root.filePath(QLatin1String(cutconst::SEQUENCE_DIRECTORY))).isDir()) {
        return Error::invalid_archive(QStringLiteral("Invalid project structure: missing %1/")
                                          .arg(QLatin1String(cutconst::SEQUENCE_DIRECTORY)));
    }
    return Result<void>();
}

QStringList ProjectArchive::findSequenceFiles(const QString& directory)
{
    QDir sequences(QDir(directory).filePath(QLatin1String(cutconst::SEQUENCE_DIRECTORY)));
    if (!sequences.exists()) {
        return QStringList();
    }

    QStringList found;
    const QStringList candidates = sequences.entryList({QStringLiteral("*.xml")}, QDir::Files, QDir::Name);
    for (const QString& candidate : candidates) {
        const QString path = sequences.filePath(candidate);
        if (SequenceDocument::isSequenceContainer(path)) {
            found.append(path);
        } else {
            qCDebug(jlcArchive, "Skipping %s: not a sequence container", qPrintable(candidate));
        }
    }
    return found;
}

Result<QList<ArchiveEntry>> ProjectArchive::listEntries(const QString& archivePath) const
{
    Result<QByteArray> output = runTool(QLatin1String(cutconst::UNZIP_TOOL),
                                        {QStringLiteral("-l"), archivePath});
    if (output.is_error()) {
        return output.error();
    }
    return parseListing(QString::fromUtf8(output.value()));
}

Result<void> ProjectArchive::extract(const QString& archivePath, const QString& destination) const
{
    // Algorithm: Check size → List and validate → unzip → Verify layout
    const QFileInfo archive(archivePath);
    if (!archive.isFile()) {
        return Error::file_not_found(archivePath);
    }
    if (archive.size() > m_limits.maxArchiveBytes) {
        return Error::invalid_archive(QStringLiteral("File size (%1 bytes) exceeds maximum (%2 bytes)")
                                          .arg(QString::number(archive.size()),
                                               QString::number(m_limits.maxArchiveBytes)));
    }

    Result<QList<ArchiveEntry>> entries = listEntries(archivePath);
    if (entries.is_error()) {
        return entries.error();
    }
    Result<void> valid = validateEntries(entries.value(), m_limits);
    if (valid.is_error()) {
        qCWarning(jlcArchive, "Rejecting %s: %s", qPrintable(archivePath), qPrintable(valid.error().message));
        return valid;
    }

    if (!QDir().mkpath(destination)) {
        return Error::io_failed(QStringLiteral("Cannot create directory %1").arg(destination));
    }

    Result<QByteArray> unpacked = runTool(QLatin1String(cutconst::UNZIP_TOOL),
                                          {QStringLiteral("-q"), QStringLiteral("-o"), archivePath,
                                           QStringLiteral("-d"), destination});
    if (unpacked.is_error()) {
        return unpacked.error();
    }

    qCInfo(jlcArchive, "Extracted %s (%lld entries)", qPrintable(archive.fileName()),
           (long long)entries.value().size());
    return verifyLayout(destination);
}

Result<QString> ProjectArchive::pack(const QString& sourceDirectory, const QString& outputPath) const
{
    if (!QFileInfo(sourceDirectory).isDir()) {
        return Error::file_not_found(sourceDirectory);
    }

    const QString target = QFileInfo(outputPath).absoluteFilePath();
    const QString temporary = target + QStringLiteral(".tmp");
    if (QFile::exists(temporary) && !QFile::remove(temporary)) {
        return Error::io_failed(QStringLiteral("Cannot remove stale %1").arg(temporary));
    }

    Result<QByteArray> packed = runTool(QLatin1String(cutconst::ZIP_TOOL),
                                        {QStringLiteral("-q"), QStringLiteral("-r"), QStringLiteral("-X"),
                                         temporary, QStringLiteral(".")},
                                        sourceDirectory);
    if (packed.is_error()) {
        QFile::remove(temporary);
        return packed.error();
    }

    if (QFile::exists(target) && !QFile::remove(target)) {
        QFile::remove(temporary);
        return Error::io_failed(QStringLiteral("Cannot replace existing %1").arg(target));
    }
    if (!QFile::rename(temporary, target)) {
        QFile::remove(temporary);
        return Error::io_failed(QStringLiteral("Cannot move %1 into place").arg(target));
    }

    qCInfo(jlcArchive, "Created %s", qPrintable(QFileInfo(target).fileName()));
    return target;
}

Result<QByteArray> ProjectArchive::runTool(const QString& tool, const QStringList& arguments,
                                           const QString& workingDirectory) const
{
    const QString executable = QStandardPaths::findExecutable(tool);
    if (executable.isEmpty()) {
        return Error::tool_unavailable(tool);
    }

    QProcess process;
    QProcessEnvironment environment = QProcessEnvironment::systemEnvironment();
    environment.insert(QStringLiteral("LC_ALL"), QStringLiteral("C"));
    process.setProcessEnvironment(environment);
    if (!workingDirectory.isEmpty()) {
        process.setWorkingDirectory(workingDirectory);
    }

    qCDebug(jlcArchive, "Running %s %s", qPrintable(tool), qPrintable(arguments.join(QLatin1Char(' '))));
    process.start(executable, arguments);
    if (!process.waitForStarted(m_limits.processTimeoutMs)) {
        return Error::io_failed(QStringLiteral("%1 failed to start: %2").arg(tool, process.errorString()));
    }
    if (!process.waitForFinished(m_limits.processTimeoutMs)) {
        process.kill();
        process.waitForFinished(3000);
        return Error::io_failed(QStringLiteral("%1 timed out after %2 ms")
                                    .arg(tool, QString::number(m_limits.processTimeoutMs)));
    }

    if (process.exitStatus() != QProcess::NormalExit || process.exitCode() != 0) {
        const QString detail = QString::fromUtf8(process.readAllStandardError()).trimmed();
        const ErrorCode code = tool == QLatin1String(cutconst::UNZIP_TOOL) ? ErrorCode::InvalidArchive
                                                                           : ErrorCode::IoFailed;
        return Error{code, QStringLiteral("%1 exited with code %2: %3")
                               .arg(tool, QString::number(process.exitCode()), detail)};
    }
    return process.readAllStandardOutput();
}

} // namespace JLC
