#include "cut_session.h"
#include "../cuts/boundary_detector.h"
#include "../cuts/cut_transformer.h"
#include "../resolve/project_archive.h"

#include <QDir>
#include <QFileInfo>
#include <QJsonArray>
#include <QLoggingCategory>
#include <QTemporaryDir>

#include <exception>

Q_LOGGING_CATEGORY(jlcSession, "jlc.api.session")

namespace JLC {

int SessionReport::boundaryCount() const
{
    int total = 0;
    for (const SequenceOutcome& sequence : sequences) {
        total += sequence.report.boundaryCount();
    }
    return total;
}

int SessionReport::eligibleCount() const
{
    int total = 0;
    for (const SequenceOutcome& sequence : sequences) {
        total += sequence.report.eligibleCount();
    }
    return total;
}

int SessionReport::appliedCount() const
{
    int total = 0;
    for (const SequenceOutcome& sequence : sequences) {
        total += sequence.report.appliedCount();
    }
    return total;
}

int SessionReport::failedCount() const
{
    int total = 0;
    for (const SequenceOutcome& sequence : sequences) {
        total += sequence.report.failedCount();
    }
    return total;
}

int SessionReport::handleLimitedCount() const
{
    int total = 0;
    for (const SequenceOutcome& sequence : sequences) {
        total += sequence.report.handleLimitedCount();
    }
    return total;
}

bool SessionReport::isHandleLimited() const
{
    return appliedCount() == 0 && eligibleCount() > 0 && handleLimitedCount() == eligibleCount();
}

QStringList SessionReport::messages() const
{
    QStringList lines;
    for (const SequenceOutcome& sequence : sequences) {
        if (sequence.isRefused()) {
            lines << QStringLiteral("Sequence %1: not processed, %2").arg(sequence.name, sequence.refusal);
            continue;
        }
        lines << QStringLiteral("Sequence %1: %2").arg(sequence.name, sequence.report.summary());
        for (const QString& line : sequence.report.messages()) {
            lines << QStringLiteral("  ") + line;
        }
    }

    if (outputWritten) {
        lines << QStringLiteral("Wrote %1").arg(outputPath);
    } else {
        lines << QStringLiteral("No output written: %1").arg(notWrittenReason);
    }
    return lines;
}

QJsonObject SessionReport::toJson() const
{
    QJsonArray sequenceArray;
    for (const SequenceOutcome& sequence : sequences) {
        QJsonObject entry = sequence.isRefused() ? QJsonObject() : sequence.report.toJson();
        entry["sequence"] = sequence.name;
        entry["path"] = sequence.path;
        if (sequence.isRefused()) {
            entry["refused"] = sequence.refusal;
        }
        entry["rewritten_clips"] = sequence.rewrittenClips;
        sequenceArray.append(entry);
    }

    QJsonObject totals;
    totals["boundaries"] = boundaryCount();
    totals["eligible"] = eligibleCount();
    totals["applied"] = appliedCount();
    totals["failed"] = failedCount();
    totals["short_of_handle"] = handleLimitedCount();

    QJsonObject obj;
    obj["input"] = inputPath;
    obj["mode"] = QLatin1String(cutModeName(parameters.mode));
    obj["offset_frames"] = parameters.offsetFrames;
    obj["dry_run"] = parameters.dryRun;
    obj["suspect"] = isSuspect();
    obj["output_written"] = outputWritten;
    if (outputWritten) {
        obj["output"] = outputPath;
    } else {
        obj["not_written_reason"] = notWrittenReason;
    }
    obj["totals"] = totals;
    obj["sequences"] = sequenceArray;
    if (outputWritten) {
        obj["journal_checksum"] = journalChecksum();
    }
    return obj;
}

std::vector<jlc::journal::EditEvent> SessionReport::journalEvents() const
{
    std::vector<jlc::journal::EditEvent> events;
    for (const SequenceOutcome& sequence : sequences) {
        const std::vector<jlc::journal::EditEvent> sequenceEvents = sequence.report.journalEvents(sequence.name);
        events.insert(events.end(), sequenceEvents.begin(), sequenceEvents.end());
    }
    return events;
}

QString SessionReport::journalChecksum() const
{
    return QString::fromStdString(jlc::journal::computeJournalChecksum(journalEvents()));
}

CutSession::CutSession(const RunConfig& config)
    : m_config(config)
{
}

Result<SessionReport> CutSession::process(const QString& inputPath) const
{
    const QFileInfo input(inputPath);
    if (!input.isFile()) {
        return Error::file_not_found(inputPath);
    }

    const QString suffix = input.suffix().toLower();
    if (suffix == QLatin1String(cutconst::PROJECT_ARCHIVE_SUFFIX)) {
        return processArchive(inputPath);
    }
    if (suffix == QLatin1String("xml")) {
        return processSequenceFile(inputPath);
    }
    return Error::invalid_arg(QStringLiteral("Unsupported input %1: expected a .%2 project or a sequence .xml")
                                  .arg(input.fileName(), QLatin1String(cutconst::PROJECT_ARCHIVE_SUFFIX)));
}

Result<SessionReport> CutSession::processArchive(const QString& archivePath) const
{
    // Algorithm: Extract → Find sequences → Cut each → Decide output → Write back → Repack
    Result<void> valid = m_config.validate();
    if (valid.is_error()) {
        return valid.error();
    }

    QTemporaryDir workspace;
    if (!workspace.isValid()) {
        return Error::io_failed(QStringLiteral("Cannot create temporary directory: %1").arg(workspace.errorString()));
    }

    const ProjectArchive archive(m_config.archive);
    Result<void> extracted = archive.extract(archivePath, workspace.path());
    if (extracted.is_error()) {
        return extracted.error();
    }

    const QStringList sequenceFiles = ProjectArchive::findSequenceFiles(workspace.path());
    if (sequenceFiles.isEmpty()) {
        return Error::invalid_archive(QStringLiteral("No timelines found in project file"));
    }

    SessionReport report;
    report.inputPath = archivePath;
    report.parameters = m_config.cutParameters();

    SequenceDocument::ParseOptions options;
    options.assumedTailHandle = m_config.assumedTailHandle;

    QList<LoadedSequence> loaded;
    for (const QString& path : sequenceFiles) {
        Result<SequenceDocument> document = SequenceDocument::load(path, options);
        if (document.is_error()) {
            return document.error();
        }

        LoadedSequence sequence;
        sequence.document = document.value();
        Result<SequenceOutcome> outcome = runSequence(sequence);
        if (outcome.is_error()) {
            return outcome.error();
        }
        outcome.value().path = QDir(workspace.path()).relativeFilePath(path);
        report.sequences.append(outcome.value());
        loaded.append(sequence);
    }

    bool anyProcessed = false;
    for (const SequenceOutcome& sequence : report.sequences) {
        anyProcessed = anyProcessed || !sequence.isRefused();
    }
    if (!anyProcessed) {
        return Error::invalid_archive(QStringLiteral("No sequence in %1 has both a video and an audio track")
                                          .arg(QFileInfo(archivePath).fileName()));
    }

    report.notWrittenReason = withheldReason(report);
    if (report.notWrittenReason.isEmpty()) {
        Result<void> written = writeBack(loaded, report);
        if (written.is_error()) {
            return written.error();
        }

        Result<QString> packed = archive.pack(workspace.path(), outputPathFor(archivePath));
        if (packed.is_error()) {
            return packed.error();
        }
        report.outputPath = packed.value();
        report.outputWritten = true;
    } else {
        qCInfo(jlcSession, "Not writing output for %s: %s",
               qPrintable(archivePath), qPrintable(report.notWrittenReason));
    }

    Result<void> journal = writeJournal(report);
    if (journal.is_error()) {
        return journal.error();
    }
    return report;
}

Result<SessionReport> CutSession::processSequenceFile(const QString& xmlPath) const
{
    Result<void> valid = m_config.validate();
    if (valid.is_error()) {
        return valid.error();
    }

    SequenceDocument::ParseOptions options;
    options.assumedTailHandle = m_config.assumedTailHandle;
    Result<SequenceDocument> document = SequenceDocument::load(xmlPath, options);
    if (document.is_error()) {
        return document.error();
    }

    SessionReport report;
    report.inputPath = xmlPath;
    report.parameters = m_config.cutParameters();

    QList<LoadedSequence> loaded;
    LoadedSequence sequence;
    sequence.document = document.value();
    Result<SequenceOutcome> outcome = runSequence(sequence);
    if (outcome.is_error()) {
        return outcome.error();
    }
    if (outcome.value().isRefused()) {
        const Timeline& timeline = sequence.document.timeline();
        return timeline.videoTrack() ? Error::missing_audio_track() : Error::missing_video_track();
    }
    outcome.value().path = QFileInfo(xmlPath).fileName();
    report.sequences.append(outcome.value());
    loaded.append(sequence);

    report.notWrittenReason = withheldReason(report);
    if (report.notWrittenReason.isEmpty()) {
        Result<void> written = writeBack(loaded, report);
        if (written.is_error()) {
            return written.error();
        }

        const QString target = outputPathFor(xmlPath);
        Result<void> saved = loaded.first().document.save(target);
        if (saved.is_error()) {
            return saved.error();
        }
        report.outputPath = target;
        report.outputWritten = true;
    } else {
        qCInfo(jlcSession, "Not writing output for %s: %s",
               qPrintable(xmlPath), qPrintable(report.notWrittenReason));
    }

    Result<void> journal = writeJournal(report);
    if (journal.is_error()) {
        return journal.error();
    }
    return report;
}

Result<SequenceOutcome> CutSession::runSequence(LoadedSequence& sequence) const
{
    SequenceOutcome outcome;
    outcome.name = sequence.document.name();
    sequence.edited = sequence.document.timeline();

    const BoundaryDetector detector;
    const QList<Boundary> boundaries = detector.detect(sequence.edited);

    const CutTransformer transformer(m_config.cutParameters());
    Result<RunReport> report = transformer.apply(sequence.edited, boundaries);
    if (report.is_error()) {
        const ErrorCode code = report.error().code;
        if (code == ErrorCode::MissingVideoTrack || code == ErrorCode::MissingAudioTrack) {
            qCWarning(jlcSession, "Skipping sequence %s: %s",
                      qPrintable(outcome.name), qPrintable(report.error().message));
            outcome.refusal = report.error().message;
            outcome.report = RunReport(m_config.cutParameters(), QList<BoundaryResult>());
            return outcome;
        }
        return report.error();
    }

    outcome.report = report.value();
    qCInfo(jlcSession, "Sequence %s: %s", qPrintable(outcome.name), qPrintable(outcome.report.summary()));
    return outcome;
}

QString CutSession::withheldReason(const SessionReport& report) const
{
    if (report.isSuspect()) {
        return QStringLiteral("%1 boundary(ies) failed internal consistency checks; the run is suspect")
            .arg(report.failedCount());
    }
    if (report.eligibleCount() == 0) {
        return QStringLiteral("no eligible boundaries found (audio must cut at the same frame as video)");
    }
    if (report.appliedCount() == 0) {
        return QStringLiteral("no boundaries could be applied; clips may lack handle or be too short for this offset");
    }
    if (report.parameters.dryRun) {
        return QStringLiteral("dry run");
    }
    return QString();
}

QString CutSession::outputPathFor(const QString& inputPath) const
{
    const QFileInfo input(inputPath);
    const QDir directory(m_config.outputDirectory.isEmpty() ? input.absolutePath() : m_config.outputDirectory);
    return directory.filePath(ProjectArchive::outputName(inputPath, m_config.mode));
}

Result<void> CutSession::writeBack(QList<LoadedSequence>& loaded, SessionReport& report) const
{
    for (int i = 0; i < loaded.size(); ++i) {
        SequenceOutcome& outcome = report.sequences[i];
        if (outcome.isRefused() || outcome.report.appliedCount() == 0) {
            continue;
        }

        LoadedSequence& sequence = loaded[i];
        Result<int> rewritten = sequence.document.syncFromTimeline(sequence.edited);
        if (rewritten.is_error()) {
            return rewritten.error();
        }
        outcome.rewrittenClips = rewritten.value();

        // Archive members are saved in place before repacking
        if (!sequence.document.path().isEmpty() && report.inputPath != sequence.document.path()) {
            Result<void> saved = sequence.document.save(sequence.document.path());
            if (saved.is_error()) {
                return saved;
            }
        }
    }
    return Result<void>();
}

Result<void> CutSession::writeJournal(const SessionReport& report) const
{
    if (m_config.journalPath.isEmpty()) {
        return Result<void>();
    }
    // Only edits that reached an output file are journaled
    if (!report.outputWritten) {
        qCInfo(jlcSession, "Not writing edit journal %s: %s",
               qPrintable(m_config.journalPath), qPrintable(report.notWrittenReason));
        return Result<void>();
    }

    try {
        jlc::journal::writeJournal(m_config.journalPath.toStdString(), report.journalEvents());
    } catch (const std::exception& e) {
        return Error::io_failed(QString::fromStdString(e.what()));
    }

    qCInfo(jlcSession, "Wrote edit journal %s (checksum %s)",
           qPrintable(m_config.journalPath), qPrintable(report.journalChecksum()));
    return Result<void>();
}

} // namespace JLC
