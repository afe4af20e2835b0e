#include "boundary_detector.h"

#include <QLoggingCategory>

Q_LOGGING_CATEGORY(jlcDetector, "jlc.cuts.detector")

namespace JLC {

QList<Boundary> BoundaryDetector::detect(const Timeline& timeline) const
{
    // Algorithm: Select tracks → Walk video adjacencies → Locate audio edit → Classify
    QList<Boundary> boundaries;

    const Track* video = timeline.videoTrack();
    const Track* audio = timeline.audioTrack();
    if (!video || !audio) {
        qCWarning(jlcDetector, "Timeline %s lacks a video or audio track; no boundaries", qPrintable(timeline.name()));
        return boundaries;
    }

    const QList<ClipHandle>& videoClips = video->clips();
    for (int i = 0; i + 1 < videoClips.size(); ++i) {
        const Clip* outgoing = timeline.clip(videoClips[i]);
        const Clip* incoming = timeline.clip(videoClips[i + 1]);
        if (outgoing->timelineEnd() != incoming->timelineStart()) {
            qCDebug(jlcDetector, "Video gap between %s and %s; not a cut",
                    qPrintable(outgoing->name()), qPrintable(incoming->name()));
            continue;
        }

        Boundary boundary;
        boundary.ordinal = static_cast<int>(boundaries.size()) + 1;
        boundary.frame = outgoing->timelineEnd();
        boundary.videoA = videoClips[i];
        boundary.videoB = videoClips[i + 1];

        AudioEdit edit = locateAudioEdit(timeline, *audio, boundary.frame);
        boundary.audioA = edit.outgoing;
        boundary.audioB = edit.incoming;
        classify(timeline, edit, boundary);

        qCDebug(jlcDetector, "Boundary %d at frame %lld: %s",
                boundary.ordinal, boundary.frame,
                boundary.isEligible() ? "eligible" : qPrintable(boundary.reason));
        boundaries.append(boundary);
    }

    qCInfo(jlcDetector, "Detected %lld boundaries on timeline %s",
           (long long)boundaries.size(), qPrintable(timeline.name()));
    return boundaries;
}

BoundaryDetector::AudioEdit BoundaryDetector::locateAudioEdit(const Timeline& timeline, const Track& audio, qint64 frame) const
{
    AudioEdit edit;
    for (ClipHandle handle : audio.clips()) {
        const Clip* clip = timeline.clip(handle);
        if (clip->timelineEnd() == frame && edit.outgoing == kInvalidClip) {
            edit.outgoing = handle;
        }
        if (clip->timelineStart() == frame && edit.incoming == kInvalidClip) {
            edit.incoming = handle;
        }
        if (clip->coversFrame(frame)) {
            edit.spanning = handle;
        }
        if (clip->timelineEnd() <= frame) {
            edit.before = handle;
        }
        if (clip->timelineStart() >= frame && edit.after == kInvalidClip) {
            edit.after = handle;
        }
    }
    return edit;
}

void BoundaryDetector::classify(const Timeline& timeline, const AudioEdit& edit, Boundary& boundary) const
{
    const Clip* videoA = timeline.clip(boundary.videoA);
    const Clip* videoB = timeline.clip(boundary.videoB);
    if (videoA->isZeroDuration() || videoB->isZeroDuration()) {
        markIneligible(boundary, Ineligibility::ZeroDuration,
                       QStringLiteral("video clip '%1' has no frames")
                           .arg(videoA->isZeroDuration() ? videoA->name() : videoB->name()));
        return;
    }

    if (edit.outgoing == kInvalidClip || edit.incoming == kInvalidClip) {
        if (edit.spanning != kInvalidClip) {
            markIneligible(boundary, Ineligibility::NotAVAligned,
                           QStringLiteral("audio clip '%1' runs through the picture cut")
                               .arg(timeline.clip(edit.spanning)->name()));
        } else if (edit.before != kInvalidClip && edit.after != kInvalidClip) {
            const qint64 gap = timeline.clip(edit.after)->timelineStart() - timeline.clip(edit.before)->timelineEnd();
            markIneligible(boundary, Ineligibility::AudioGap,
                           QStringLiteral("%1 frame(s) of silence between '%2' and '%3'")
                               .arg(QString::number(gap),
                                    timeline.clip(edit.before)->name(),
                                    timeline.clip(edit.after)->name()));
        } else {
            markIneligible(boundary, Ineligibility::AudioClipMissing,
                           edit.outgoing == kInvalidClip
                               ? QStringLiteral("no audio clip ends at the cut")
                               : QStringLiteral("no audio clip starts at the cut"));
        }
        return;
    }

    const Clip* audioA = timeline.clip(edit.outgoing);
    const Clip* audioB = timeline.clip(edit.incoming);
    if (audioA->isZeroDuration() || audioB->isZeroDuration()) {
        markIneligible(boundary, Ineligibility::ZeroDuration,
                       QStringLiteral("audio clip '%1' has no frames")
                           .arg(audioA->isZeroDuration() ? audioA->name() : audioB->name()));
    }
}

void BoundaryDetector::markIneligible(Boundary& boundary, Ineligibility reason, const QString& detail) const
{
    boundary.ineligibility = reason;
    boundary.reason = QStringLiteral("%1: %2").arg(QLatin1String(ineligibilityName(reason)), detail);
}

} // namespace JLC
