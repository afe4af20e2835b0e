#pragma once

#include "boundary.h"
#include "run_report.h"
#include "../common/cut_errors.h"
#include "../models/timeline.h"

#include <QList>
#include <QStringList>

namespace JLC {

/**
 * CutPlan - decisions for every boundary of a run, before anything is mutated
 * commit() builds a new Timeline from the base plus the accepted edits
 */
class CutPlan
{
public:
    CutPlan() = default;
    CutPlan(const CutParameters& parameters, const QList<BoundaryResult>& results);

    const CutParameters& parameters() const { return m_parameters; }
    const QList<BoundaryResult>& results() const { return m_results; }

    QList<ClipEdit> acceptedEdits() const;
    bool hasFailures() const;

    /**
     * Apply accepted edits to a copy of `base`
     * Algorithm: Copy base → Move each edited edge → Validate primary tracks
     */
    Result<Timeline> commit(const Timeline& base) const;

private:
    CutParameters m_parameters;
    QList<BoundaryResult> m_results;
};

/**
 * CutTransformer - shifts the audio edit point at each eligible boundary
 *
 * J mode moves the audio edit `offsetFrames` earlier (outgoing audio trimmed,
 * incoming audio extended back into its head handle); L mode moves it later
 * (outgoing audio extended into its tail handle, incoming audio trimmed).
 * Video clips are never touched. Every boundary is checked for consistency
 * and feasibility against the unmodified timeline, so outcomes do not depend
 * on which other boundaries were applied.
 */
class CutTransformer
{
public:
    explicit CutTransformer(const CutParameters& parameters);

    const CutParameters& parameters() const { return m_parameters; }

    // Decide every boundary without mutating anything
    Result<CutPlan> plan(const Timeline& timeline, const QList<Boundary>& boundaries) const;

    // Plan, then replace `timeline` with the committed result unless this is a dry run
    Result<RunReport> apply(Timeline& timeline, const QList<Boundary>& boundaries) const;

private:
    Result<void> checkRunPreconditions(const Timeline& timeline) const;
    BoundaryResult evaluate(const Timeline& timeline, const Boundary& boundary) const;
    QString findInconsistency(const Timeline& timeline, const Boundary& boundary) const;
    QStringList findInfeasibility(const Clip& outgoing, const MediaSource& outgoingMedia,
                                  const Clip& incoming, const MediaSource& incomingMedia,
                                  bool* lacksHandle) const;
    QList<ClipEdit> editsFor(const Boundary& boundary) const;

    CutParameters m_parameters;
};

// Move one edge of a clip as described by an edit
void applyEdit(Clip& clip, const ClipEdit& edit);

ClipSnapshot snapshotOf(ClipHandle handle, const Clip& clip);

} // namespace JLC
