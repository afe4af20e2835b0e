#pragma once

#include "../common/cut_errors.h"
#include "../config/run_config.h"
#include "../cuts/run_report.h"
#include "../resolve/sequence_document.h"

#include "jlc/journal/EditJournal.hpp"

#include <QJsonObject>
#include <QList>
#include <QString>
#include <QStringList>

#include <vector>

namespace JLC {

// Result of running the cut engine over one sequence container
struct SequenceOutcome {
    QString name;
    QString path;
    RunReport report;
    QString refusal;        // non-empty when the engine refused this sequence
    int rewrittenClips = 0;

    bool isRefused() const { return !refusal.isEmpty(); }
};

/**
 * SessionReport - what one jlcut invocation did, sequence by sequence
 * Output is only written for runs that applied edits, found no failures and
 * were not dry runs; otherwise notWrittenReason says why.
 */
struct SessionReport {
    QString inputPath;
    QString outputPath;
    bool outputWritten = false;
    QString notWrittenReason;
    CutParameters parameters;
    QList<SequenceOutcome> sequences;

    int boundaryCount() const;
    int eligibleCount() const;
    int appliedCount() const;
    int failedCount() const;
    bool isSuspect() const { return failedCount() > 0; }
    int handleLimitedCount() const;

    // Nothing applied and every eligible boundary was short of source handle
    bool isHandleLimited() const;

    QStringList messages() const;
    QJsonObject toJson() const;

    // Edits of every applied boundary; only journaled once output is written
    std::vector<jlc::journal::EditEvent> journalEvents() const;
    QString journalChecksum() const;
};

/**
 * CutSession - runs detection and transformation over a whole input
 *
 * Inputs are either a .drp project archive or a single sequence XML file.
 * The input is never modified; results go to a sibling file named after the
 * cut mode, in the configured output directory when one is set.
 */
class CutSession
{
public:
    explicit CutSession(const RunConfig& config);

    const RunConfig& config() const { return m_config; }

    // Dispatch on the input suffix
    Result<SessionReport> process(const QString& inputPath) const;

    /**
     * Process a project archive
     * Algorithm: Extract → Find sequences → Cut each → Decide output → Write back → Repack
     */
    Result<SessionReport> processArchive(const QString& archivePath) const;

    Result<SessionReport> processSequenceFile(const QString& xmlPath) const;

private:
    struct LoadedSequence {
        SequenceDocument document;
        Timeline edited;
    };

    Result<SequenceOutcome> runSequence(LoadedSequence& sequence) const;
    QString withheldReason(const SessionReport& report) const;
    QString outputPathFor(const QString& inputPath) const;
    Result<void> writeBack(QList<LoadedSequence>& loaded, SessionReport& report) const;
    Result<void> writeJournal(const SessionReport& report) const;

    RunConfig m_config;
};

} // namespace JLC
