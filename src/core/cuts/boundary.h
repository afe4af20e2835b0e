#pragma once

#include "../models/clip.h"

#include <QList>
#include <QString>
#include <QtGlobal>

namespace JLC {

enum class CutMode {
    J,  // audio leads: incoming audio starts before the picture cut
    L   // audio trails: outgoing audio runs past the picture cut
};

const char* cutModeName(CutMode mode);
bool parseCutMode(const QString& text, CutMode* mode);

// One offset and mode for every boundary of a run
struct CutParameters {
    qint64 offsetFrames = 0;
    CutMode mode = CutMode::J;
    bool dryRun = false;
};

enum class Ineligibility {
    None,
    AudioClipMissing,
    AudioGap,
    NotAVAligned,
    ZeroDuration
};

const char* ineligibilityName(Ineligibility reason);

/**
 * Boundary - a picture cut at frame F with the audio edit found there
 * Derived from a Timeline by BoundaryDetector; handles index that timeline
 */
struct Boundary {
    int ordinal = 0;            // 1-based position in timeline order
    qint64 frame = 0;
    ClipHandle videoA = kInvalidClip;
    ClipHandle videoB = kInvalidClip;
    ClipHandle audioA = kInvalidClip;  // audio ending at F
    ClipHandle audioB = kInvalidClip;  // audio starting at F
    Ineligibility ineligibility = Ineligibility::None;
    QString reason;

    bool isEligible() const { return ineligibility == Ineligibility::None; }
};

enum class ClipEdge {
    Head,
    Tail
};

// Accepted mutation: move one edge of one clip by `delta` frames
struct ClipEdit {
    ClipHandle clip = kInvalidClip;
    ClipEdge edge = ClipEdge::Tail;
    qint64 delta = 0;
};

// Timing of one clip, captured for reporting
struct ClipSnapshot {
    ClipHandle handle = kInvalidClip;
    QString name;
    qint64 timelineStart = 0;
    qint64 duration = 0;
    qint64 sourceIn = 0;

    qint64 sourceOut() const { return sourceIn + duration; }
    bool operator==(const ClipSnapshot& other) const;
};

enum class Outcome {
    Applied,
    SkippedIneligible,
    SkippedInfeasible,
    Failed
};

const char* outcomeName(Outcome outcome);

struct BoundaryResult {
    Boundary boundary;
    Outcome outcome = Outcome::Failed;
    QString reason;
    bool lacksHandle = false;   // infeasible at least partly for want of source handle
    QList<ClipEdit> edits;
    QList<ClipSnapshot> before;
    QList<ClipSnapshot> after;

    bool operator==(const BoundaryResult& other) const;
    bool operator!=(const BoundaryResult& other) const { return !(*this == other); }
};

} // namespace JLC
