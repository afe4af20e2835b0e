#pragma once

#include "boundary.h"

#include "jlc/journal/EditJournal.hpp"

#include <QJsonObject>
#include <QList>
#include <QString>
#include <QStringList>

#include <vector>

namespace JLC {

/**
 * RunReport - per-boundary outcomes of one cut pass over a timeline
 * A report holding any Failed result is suspect; callers should not write output from it
 */
class RunReport
{
public:
    RunReport() = default;
    RunReport(const CutParameters& parameters, const QList<BoundaryResult>& results);

    const CutParameters& parameters() const { return m_parameters; }
    const QList<BoundaryResult>& results() const { return m_results; }

    // Outcome counts
    int boundaryCount() const { return static_cast<int>(m_results.size()); }
    int appliedCount() const { return count(Outcome::Applied); }
    int ineligibleCount() const { return count(Outcome::SkippedIneligible); }
    int infeasibleCount() const { return count(Outcome::SkippedInfeasible); }
    int failedCount() const { return count(Outcome::Failed); }

    // Infeasible boundaries that were short of source handle
    int handleLimitedCount() const;
    int skippedCount() const { return ineligibleCount() + infeasibleCount(); }
    int eligibleCount() const { return boundaryCount() - ineligibleCount(); }

    bool isSuspect() const { return failedCount() > 0; }
    bool isDryRun() const { return m_parameters.dryRun; }

    // Human-readable rendering
    QString summary() const;
    QStringList messages() const;

    QJsonObject toJson() const;

    // Applied edits as journal records
    std::vector<jlc::journal::EditEvent> journalEvents(const QString& sequenceName) const;

private:
    int count(Outcome outcome) const;
    QString describe(const BoundaryResult& result) const;

    CutParameters m_parameters;
    QList<BoundaryResult> m_results;
};

} // namespace JLC
