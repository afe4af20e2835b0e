#include "boundary.h"

namespace JLC {

const char* cutModeName(CutMode mode)
{
    switch (mode) {
    case CutMode::J: return "J";
    case CutMode::L: return "L";
    }
    return "?";
}

bool parseCutMode(const QString& text, CutMode* mode)
{
    const QString normalized = text.trimmed().toUpper();
    if (normalized == QLatin1String("J")) {
        *mode = CutMode::J;
        return true;
    }
    if (normalized == QLatin1String("L")) {
        *mode = CutMode::L;
        return true;
    }
    return false;
}

const char* ineligibilityName(Ineligibility reason)
{
    switch (reason) {
    case Ineligibility::None:             return "none";
    case Ineligibility::AudioClipMissing: return "audio clip missing";
    case Ineligibility::AudioGap:         return "audio gap";
    case Ineligibility::NotAVAligned:     return "boundary not A/V aligned";
    case Ineligibility::ZeroDuration:     return "zero-duration clip";
    }
    return "unknown";
}

const char* outcomeName(Outcome outcome)
{
    switch (outcome) {
    case Outcome::Applied:           return "applied";
    case Outcome::SkippedIneligible: return "skipped_ineligible";
    case Outcome::SkippedInfeasible: return "skipped_infeasible";
    case Outcome::Failed:            return "failed";
    }
    return "unknown";
}

bool ClipSnapshot::operator==(const ClipSnapshot& other) const
{
    return handle == other.handle
        && name == other.name
        && timelineStart == other.timelineStart
        && duration == other.duration
        && sourceIn == other.sourceIn;
}

bool BoundaryResult::operator==(const BoundaryResult& other) const
{
    auto sameEdits = [](const QList<ClipEdit>& a, const QList<ClipEdit>& b) {
        if (a.size() != b.size()) {
            return false;
        }
        for (int i = 0; i < a.size(); ++i) {
            if (a[i].clip != b[i].clip || a[i].edge != b[i].edge || a[i].delta != b[i].delta) {
                return false;
            }
        }
        return true;
    };

    return boundary.ordinal == other.boundary.ordinal
        && boundary.frame == other.boundary.frame
        && boundary.audioA == other.boundary.audioA
        && boundary.audioB == other.boundary.audioB
        && outcome == other.outcome
        && reason == other.reason
        && lacksHandle == other.lacksHandle
        && sameEdits(edits, other.edits)
        && before == other.before
        && after == other.after;
}

} // namespace JLC
