#pragma once

#include "../common/cut_constants.h"
#include "../common/cut_errors.h"
#include "../cuts/boundary.h"

#include <QByteArray>
#include <QList>
#include <QString>
#include <QStringList>

namespace JLC {

struct ArchiveEntry {
    QString path;
    qint64 size = 0;
};

struct ArchiveLimits {
    qint64 maxArchiveBytes = cutconst::DEFAULT_MAX_ARCHIVE_BYTES;
    qint64 maxExtractedBytes = cutconst::DEFAULT_MAX_EXTRACTED_BYTES;
    int processTimeoutMs = cutconst::DEFAULT_PROCESS_TIMEOUT_MS;
};

/**
 * ProjectArchive - .drp project packaging through the system zip/unzip tools
 *
 * A project archive holds project.xml and a SeqContainer/ directory of
 * sequence containers. Listings are checked before anything is extracted;
 * repacking writes `<output>.tmp` and renames it into place.
 */
class ProjectArchive
{
public:
    explicit ProjectArchive(const ArchiveLimits& limits = ArchiveLimits());

    const ArchiveLimits& limits() const { return m_limits; }

    // Empty when both tools are on PATH, else the first missing tool
    static QString missingTool();

    // "<stem> (J cuts added).drp" beside the input
    static QString outputName(const QString& inputPath, CutMode mode);

    // Parse `unzip -l` output into entries
    static Result<QList<ArchiveEntry>> parseListing(const QString& listing);

    /**
     * Reject listings that are unsafe or not a project
     * Algorithm: Sum sizes → Check each path → Require manifest
     */
    static Result<void> validateEntries(const QList<ArchiveEntry>& entries, const ArchiveLimits& limits);

    static Result<void> verifyLayout(const QString& directory);
    static QStringList findSequenceFiles(const QString& directory);

    Result<QList<ArchiveEntry>> listEntries(const QString& archivePath) const;

    /**
     * Unpack a project into `destination`
     * Algorithm: Check size → List and validate → unzip → Verify layout
     */
    Result<void> extract(const QString& archivePath, const QString& destination) const;

    // Zip the contents of `sourceDirectory` into `outputPath`
    Result<QString> pack(const QString& sourceDirectory, const QString& outputPath) const;

private:
    Result<QByteArray> runTool(const QString& tool, const QStringList& arguments,
                               const QString& workingDirectory = QString()) const;

    ArchiveLimits m_limits;
};

} // namespace JLC
