#include "cut_transformer.h"
#include "../common/cut_constants.h"

#include <QLoggingCategory>

Q_LOGGING_CATEGORY(jlcTransformer, "jlc.cuts.transformer")

namespace JLC {

void applyEdit(Clip& clip, const ClipEdit& edit)
{
    if (edit.edge == ClipEdge::Head) {
        clip.trimStart(edit.delta);
    } else {
        clip.trimEnd(edit.delta);
    }
}

ClipSnapshot snapshotOf(ClipHandle handle, const Clip& clip)
{
    ClipSnapshot snapshot;
    snapshot.handle = handle;
    snapshot.name = clip.name();
    snapshot.timelineStart = clip.timelineStart();
    snapshot.duration = clip.duration();
    snapshot.sourceIn = clip.sourceIn();
    return snapshot;
}

CutPlan::CutPlan(const CutParameters& parameters, const QList<BoundaryResult>& results)
    : m_parameters(parameters)
    , m_results(results)
{
}

QList<ClipEdit> CutPlan::acceptedEdits() const
{
    QList<ClipEdit> edits;
    for (const BoundaryResult& result : m_results) {
        if (result.outcome == Outcome::Applied) {
            edits.append(result.edits);
        }
    }
    return edits;
}

bool CutPlan::hasFailures() const
{
    for (const BoundaryResult& result : m_results) {
        if (result.outcome == Outcome::Failed) {
            return true;
        }
    }
    return false;
}

Result<Timeline> CutPlan::commit(const Timeline& base) const
{
    // Algorithm: Copy base → Move each edited edge → Validate primary tracks
    Timeline next = base;
    for (const ClipEdit& edit : acceptedEdits()) {
        const Clip* current = next.clip(edit.clip);
        if (!current) {
            return Error::internal(QStringLiteral("Accepted edit names unknown clip #%1").arg(edit.clip));
        }

        Clip edited = *current;
        applyEdit(edited, edit);
        next.retimeClip(edit.clip, edited.timelineStart(), edited.duration(), edited.sourceIn());
    }

    // Tracks beyond the primary pair pass through unchecked
    Result<void> check = next.validateTracks(next.primaryTrackIndices());
    if (check.is_error()) {
        qCCritical(jlcTransformer, "Committed timeline violates model invariants: %s",
                   qPrintable(check.error().message));
        return check.error();
    }
    return next;
}

CutTransformer::CutTransformer(const CutParameters& parameters)
    : m_parameters(parameters)
{
}

Result<CutPlan> CutTransformer::plan(const Timeline& timeline, const QList<Boundary>& boundaries) const
{
    // Algorithm: Check run preconditions → Evaluate each boundary in order → Collect plan
    Result<void> preconditions = checkRunPreconditions(timeline);
    if (preconditions.is_error()) {
        qCWarning(jlcTransformer, "Refusing run: %s", qPrintable(preconditions.error().message));
        return preconditions.error();
    }

    QList<BoundaryResult> results;
    results.reserve(boundaries.size());
    for (const Boundary& boundary : boundaries) {
        results.append(evaluate(timeline, boundary));
    }
    return CutPlan(m_parameters, results);
}

Result<RunReport> CutTransformer::apply(Timeline& timeline, const QList<Boundary>& boundaries) const
{
    Result<CutPlan> planned = plan(timeline, boundaries);
    if (planned.is_error()) {
        return planned.error();
    }

    const CutPlan& cutPlan = planned.value();
    RunReport report(m_parameters, cutPlan.results());

    if (!m_parameters.dryRun && report.appliedCount() > 0) {
        Result<Timeline> committed = cutPlan.commit(timeline);
        if (committed.is_error()) {
            return committed.error();
        }
        timeline = committed.value();
    }

    qCInfo(jlcTransformer, "%s", qPrintable(report.summary()));
    return report;
}

Result<void> CutTransformer::checkRunPreconditions(const Timeline& timeline) const
{
    if (!timeline.videoTrack()) {
        return Error::missing_video_track();
    }
    if (!timeline.audioTrack()) {
        return Error::missing_audio_track();
    }
    if (m_parameters.offsetFrames < cutconst::MIN_OFFSET_FRAMES) {
        return Error::invalid_arg(QStringLiteral("Offset must be a positive number of frames (got %1)")
                                      .arg(m_parameters.offsetFrames));
    }
    return Result<void>();
}

BoundaryResult CutTransformer::evaluate(const Timeline& timeline, const Boundary& boundary) const
{
    // Algorithm: Eligibility → Consistency → Feasibility → Record edits
    BoundaryResult result;
    result.boundary = boundary;

    if (!boundary.isEligible()) {
        result.outcome = Outcome::SkippedIneligible;
        result.reason = boundary.reason;
        return result;
    }

    const QString inconsistency = findInconsistency(timeline, boundary);
    if (!inconsistency.isEmpty()) {
        qCWarning(jlcTransformer, "Boundary %d at frame %lld failed: %s",
                  boundary.ordinal, boundary.frame, qPrintable(inconsistency));
        result.outcome = Outcome::Failed;
        result.reason = inconsistency;
        return result;
    }

    const Clip& outgoing = *timeline.clip(boundary.audioA);
    const Clip& incoming = *timeline.clip(boundary.audioB);
    bool lacksHandle = false;
    const QStringList unmet = findInfeasibility(outgoing, *timeline.mediaSource(outgoing.media()),
                                                incoming, *timeline.mediaSource(incoming.media()),
                                                &lacksHandle);
    if (!unmet.isEmpty()) {
        qCDebug(jlcTransformer, "Boundary %d at frame %lld infeasible: %s",
                boundary.ordinal, boundary.frame, qPrintable(unmet.join(QStringLiteral("; "))));
        result.outcome = Outcome::SkippedInfeasible;
        result.reason = unmet.join(QStringLiteral("; "));
        result.lacksHandle = lacksHandle;
        return result;
    }

    result.outcome = Outcome::Applied;
    result.edits = editsFor(boundary);
    result.before << snapshotOf(boundary.audioA, outgoing) << snapshotOf(boundary.audioB, incoming);

    Clip outgoingAfter = outgoing;
    Clip incomingAfter = incoming;
    applyEdit(outgoingAfter, result.edits[0]);
    applyEdit(incomingAfter, result.edits[1]);
    result.after << snapshotOf(boundary.audioA, outgoingAfter) << snapshotOf(boundary.audioB, incomingAfter);
    return result;
}

QString CutTransformer::findInconsistency(const Timeline& timeline, const Boundary& boundary) const
{
    const int videoIndex = timeline.primaryTrackIndex(Track::Video);
    const int audioIndex = timeline.primaryTrackIndex(Track::Audio);

    struct Expected {
        ClipHandle handle;
        int track;
        const char* role;
    };
    const Expected expected[] = {
        {boundary.videoA, videoIndex, "outgoing video"},
        {boundary.videoB, videoIndex, "incoming video"},
        {boundary.audioA, audioIndex, "outgoing audio"},
        {boundary.audioB, audioIndex, "incoming audio"},
    };

    for (const Expected& entry : expected) {
        const Clip* clip = timeline.clip(entry.handle);
        if (!clip) {
            return QStringLiteral("%1 clip reference #%2 resolves to no clip")
                .arg(QLatin1String(entry.role), QString::number(entry.handle));
        }
        if (clip->track() != entry.track || !timeline.track(entry.track)->containsClip(entry.handle)) {
            return QStringLiteral("%1 clip '%2' is not on the %3 track")
                .arg(QLatin1String(entry.role), clip->name(),
                     entry.track == audioIndex ? QStringLiteral("audio") : QStringLiteral("video"));
        }
        if (!timeline.mediaSource(clip->media())) {
            return QStringLiteral("%1 clip '%2' references unknown media '%3'")
                .arg(QLatin1String(entry.role), clip->name(), clip->mediaRef());
        }
    }

    if (boundary.audioA == boundary.audioB) {
        return QStringLiteral("outgoing and incoming audio are the same clip");
    }

    const Clip* outgoing = timeline.clip(boundary.audioA);
    const Clip* incoming = timeline.clip(boundary.audioB);
    if (outgoing->timelineEnd() != boundary.frame || incoming->timelineStart() != boundary.frame) {
        return QStringLiteral("boundary at frame %1 is stale: audio meets at %2/%3")
            .arg(QString::number(boundary.frame),
                 QString::number(outgoing->timelineEnd()),
                 QString::number(incoming->timelineStart()));
    }
    return QString();
}

QStringList CutTransformer::findInfeasibility(const Clip& outgoing, const MediaSource& outgoingMedia,
                                              const Clip& incoming, const MediaSource& incomingMedia,
                                              bool* lacksHandle) const
{
    const qint64 offset = m_parameters.offsetFrames;
    const qint64 minimum = cutconst::MIN_CLIP_DURATION_FRAMES;

    // J trims the outgoing tail and extends the incoming head; L the reverse
    const bool jCut = m_parameters.mode == CutMode::J;
    const Clip& trimmed = jCut ? outgoing : incoming;
    const QString trimmedRole = jCut ? QStringLiteral("A") : QStringLiteral("B");

    QStringList unmet;
    if (trimmed.duration() - offset < minimum) {
        unmet << QStringLiteral("clip %1 '%2' is %3 frame(s) long, trimming %4 would leave %5 (minimum duration %6)")
                     .arg(trimmedRole, trimmed.name(),
                          QString::number(trimmed.duration()),
                          QString::number(offset),
                          QString::number(trimmed.duration() - offset),
                          QString::number(minimum));
    }

    if (jCut) {
        const qint64 available = incomingMedia.headHandle(incoming.sourceIn());
        if (available < offset) {
            *lacksHandle = true;
            unmet << QStringLiteral("clip B '%1' needs %2 more frame(s) of source handle before its in-point (has %3, needs %4)")
                         .arg(incoming.name(),
                              QString::number(offset - available),
                              QString::number(available),
                              QString::number(offset));
        }
    } else {
        const qint64 available = outgoingMedia.tailHandle(outgoing.sourceOut());
        if (available < offset) {
            *lacksHandle = true;
            unmet << QStringLiteral("clip A '%1' needs %2 more frame(s) of source handle after its out-point (has %3, needs %4)")
                         .arg(outgoing.name(),
                              QString::number(offset - available),
                              QString::number(available),
                              QString::number(offset));
        }
    }
    return unmet;
}

QList<ClipEdit> CutTransformer::editsFor(const Boundary& boundary) const
{
    // J pulls the shared audio edit earlier, L pushes it later; both clips move the same way
    const qint64 delta = m_parameters.mode == CutMode::J ? -m_parameters.offsetFrames : m_parameters.offsetFrames;

    ClipEdit outgoingTail;
    outgoingTail.clip = boundary.audioA;
    outgoingTail.edge = ClipEdge::Tail;
    outgoingTail.delta = delta;

    ClipEdit incomingHead;
    incomingHead.clip = boundary.audioB;
    incomingHead.edge = ClipEdge::Head;
    incomingHead.delta = delta;

    return {outgoingTail, incomingHead};
}

} // namespace JLC
