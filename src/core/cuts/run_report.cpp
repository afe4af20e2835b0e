#include "run_report.h"

#include <QJsonArray>

namespace JLC {

namespace {

QJsonObject snapshotToJson(const ClipSnapshot& snapshot)
{
    QJsonObject obj;
    obj["clip"] = snapshot.name;
    obj["start"] = snapshot.timelineStart;
    obj["duration"] = snapshot.duration;
    obj["source_in"] = snapshot.sourceIn;
    obj["source_out"] = snapshot.sourceOut();
    return obj;
}

QString describeChange(const QString& role, const ClipSnapshot& before, const ClipSnapshot& after)
{
    QStringList changes;
    if (before.timelineStart != after.timelineStart) {
        changes << QStringLiteral("start %1->%2").arg(before.timelineStart).arg(after.timelineStart);
    }
    if (before.duration != after.duration) {
        changes << QStringLiteral("duration %1->%2").arg(before.duration).arg(after.duration);
    }
    if (before.sourceIn != after.sourceIn) {
        changes << QStringLiteral("in %1->%2").arg(before.sourceIn).arg(after.sourceIn);
    }
    if (before.sourceOut() != after.sourceOut()) {
        changes << QStringLiteral("out %1->%2").arg(before.sourceOut()).arg(after.sourceOut());
    }
    return QStringLiteral("%1 '%2' %3").arg(role, before.name, changes.join(QStringLiteral(", ")));
}

} // namespace

RunReport::RunReport(const CutParameters& parameters, const QList<BoundaryResult>& results)
    : m_parameters(parameters)
    , m_results(results)
{
}

QString RunReport::summary() const
{
    return QStringLiteral("%1-cuts, offset %2 frame(s)%3: %4 boundaries, %5 applied, %6 skipped (%7 ineligible, %8 infeasible), %9 failed")
        .arg(QLatin1String(cutModeName(m_parameters.mode)))
        .arg(m_parameters.offsetFrames)
        .arg(m_parameters.dryRun ? QStringLiteral(" [dry run]") : QString())
        .arg(boundaryCount())
        .arg(appliedCount())
        .arg(skippedCount())
        .arg(ineligibleCount())
        .arg(infeasibleCount())
        .arg(failedCount());
}

QStringList RunReport::messages() const
{
    QStringList lines;
    for (const BoundaryResult& result : m_results) {
        lines << describe(result);
    }
    return lines;
}

QJsonObject RunReport::toJson() const
{
    QJsonArray boundaries;
    for (const BoundaryResult& result : m_results) {
        QJsonObject entry;
        entry["boundary"] = result.boundary.ordinal;
        entry["frame"] = result.boundary.frame;
        entry["outcome"] = QLatin1String(outcomeName(result.outcome));
        if (!result.reason.isEmpty()) {
            entry["reason"] = result.reason;
        }
        if (result.outcome == Outcome::Applied) {
            QJsonArray before;
            QJsonArray after;
            for (const ClipSnapshot& snapshot : result.before) {
                before.append(snapshotToJson(snapshot));
            }
            for (const ClipSnapshot& snapshot : result.after) {
                after.append(snapshotToJson(snapshot));
            }
            entry["before"] = before;
            entry["after"] = after;
        }
        boundaries.append(entry);
    }

    QJsonObject counts;
    counts["boundaries"] = boundaryCount();
    counts["applied"] = appliedCount();
    counts["skipped_ineligible"] = ineligibleCount();
    counts["skipped_infeasible"] = infeasibleCount();
    counts["short_of_handle"] = handleLimitedCount();
    counts["failed"] = failedCount();

    QJsonObject obj;
    obj["mode"] = QLatin1String(cutModeName(m_parameters.mode));
    obj["offset_frames"] = m_parameters.offsetFrames;
    obj["dry_run"] = m_parameters.dryRun;
    obj["suspect"] = isSuspect();
    obj["counts"] = counts;
    obj["results"] = boundaries;
    return obj;
}

std::vector<jlc::journal::EditEvent> RunReport::journalEvents(const QString& sequenceName) const
{
    std::vector<jlc::journal::EditEvent> events;
    for (const BoundaryResult& result : m_results) {
        if (result.outcome != Outcome::Applied) {
            continue;
        }
        for (int i = 0; i < result.edits.size() && i < result.before.size() && i < result.after.size(); ++i) {
            const ClipEdit& edit = result.edits[i];
            const ClipSnapshot& before = result.before[i];
            const ClipSnapshot& after = result.after[i];

            jlc::journal::EditEvent event;
            event.sequence = sequenceName.toStdString();
            event.boundary = result.boundary.ordinal;
            event.frame = result.boundary.frame;
            event.mode = cutModeName(m_parameters.mode);
            event.clip = before.name.toStdString();
            event.handle = edit.clip;
            event.edge = edit.edge == ClipEdge::Head ? "head" : "tail";
            event.delta = edit.delta;
            event.startBefore = before.timelineStart;
            event.durationBefore = before.duration;
            event.sourceInBefore = before.sourceIn;
            event.startAfter = after.timelineStart;
            event.durationAfter = after.duration;
            event.sourceInAfter = after.sourceIn;
            events.push_back(event);
        }
    }
    return events;
}

int RunReport::count(Outcome outcome) const
{
    int total = 0;
    for (const BoundaryResult& result : m_results) {
        if (result.outcome == outcome) {
            ++total;
        }
    }
    return total;
}

int RunReport::handleLimitedCount() const
{
    int total = 0;
    for (const BoundaryResult& result : m_results) {
        if (result.outcome == Outcome::SkippedInfeasible && result.lacksHandle) {
            ++total;
        }
    }
    return total;
}

QString RunReport::describe(const BoundaryResult& result) const
{
    const QString prefix = QStringLiteral("Boundary %1 @ frame %2")
                               .arg(result.boundary.ordinal)
                               .arg(result.boundary.frame);

    switch (result.outcome) {
    case Outcome::Applied: {
        QStringList parts;
        for (int i = 0; i < result.before.size() && i < result.after.size(); ++i) {
            parts << describeChange(i == 0 ? QStringLiteral("A") : QStringLiteral("B"),
                                    result.before[i], result.after[i]);
        }
        return QStringLiteral("[ok]   %1: %2-cut %3 (%4)")
            .arg(prefix, QLatin1String(cutModeName(m_parameters.mode)),
                 m_parameters.dryRun ? QStringLiteral("would apply") : QStringLiteral("applied"),
                 parts.join(QStringLiteral("; ")));
    }
    case Outcome::SkippedIneligible:
        return QStringLiteral("[skip] %1: ineligible, %2").arg(prefix, result.reason);
    case Outcome::SkippedInfeasible:
        return QStringLiteral("[skip] %1: infeasible, %2").arg(prefix, result.reason);
    case Outcome::Failed:
        return QStringLiteral("[FAIL] %1: %2").arg(prefix, result.reason);
    }
    return prefix;
}

} // namespace JLC
