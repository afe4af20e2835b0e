#pragma once

#include "boundary.h"
#include "../models/timeline.h"

#include <QList>

namespace JLC {

/**
 * BoundaryDetector - finds picture cuts and classifies the audio edit at each
 *
 * Every adjacency on the primary video track where one clip ends exactly
 * where the next begins becomes a Boundary, in timeline order. A boundary is
 * eligible when the primary audio track has its own edit at the same frame:
 * one clip ending there, the next starting there. Detection never fails; a
 * timeline missing either track simply yields no boundaries.
 *
 * Boundaries of non-empty clips sit on distinct frames and an audio clip ends
 * and starts on one frame each, so no clip edge belongs to two boundaries.
 * Frames are shared only through zero-duration clips, which are ineligible.
 */
class BoundaryDetector
{
public:
    QList<Boundary> detect(const Timeline& timeline) const;

private:
    struct AudioEdit {
        ClipHandle outgoing = kInvalidClip;
        ClipHandle incoming = kInvalidClip;
        ClipHandle spanning = kInvalidClip;
        ClipHandle before = kInvalidClip;   // last clip ending at or before F
        ClipHandle after = kInvalidClip;    // first clip starting at or after F
    };

    AudioEdit locateAudioEdit(const Timeline& timeline, const Track& audio, qint64 frame) const;
    void classify(const Timeline& timeline, const AudioEdit& edit, Boundary& boundary) const;
    void markIneligible(Boundary& boundary, Ineligibility reason, const QString& detail) const;
};

} // namespace JLC
