#pragma once

#include "media_source.h"

#include <QString>
#include <QtGlobal>

namespace JLC {

// Stable index into Timeline's clip table
using ClipHandle = int;
constexpr ClipHandle kInvalidClip = -1;

/**
 * Clip entity - one trimmed use of a MediaSource on a track
 * Timing is in frames; sourceOut and timelineEnd are derived so that
 * sourceOut - sourceIn == timelineEnd - timelineStart always holds
 */
class Clip
{
public:
    Clip() = default;
    ~Clip() = default;

    Clip(const Clip& other) = default;
    Clip& operator=(const Clip& other) = default;
    Clip(Clip&& other) noexcept = default;
    Clip& operator=(Clip&& other) noexcept = default;

    /**
     * Create clip reading `duration` frames of media starting at `sourceIn`
     * Algorithm: Store identity → Place on timeline → Set source range
     */
    static Clip create(const QString& name, const QString& mediaRef,
                       qint64 timelineStart, qint64 duration, qint64 sourceIn);

    // Core properties
    QString name() const { return m_name; }
    QString mediaRef() const { return m_mediaRef; }

    // Arena links, assigned by Timeline
    MediaHandle media() const { return m_media; }
    int track() const { return m_track; }

    // Timeline positioning
    qint64 timelineStart() const { return m_timelineStart; }
    qint64 timelineEnd() const { return m_timelineStart + m_duration; }
    qint64 duration() const { return m_duration; }

    // Source timing (which part of media to use)
    qint64 sourceIn() const { return m_sourceIn; }
    qint64 sourceOut() const { return m_sourceIn + m_duration; }

    // Trimming operations
    void trimStart(qint64 offset);  // Positive = trim from start, negative = extend earlier
    void trimEnd(qint64 offset);    // Positive = extend end, negative = trim from end

    bool isZeroDuration() const { return m_duration <= 0; }
    bool coversFrame(qint64 frame) const { return frame > m_timelineStart && frame < timelineEnd(); }

    bool operator==(const Clip& other) const;
    bool operator!=(const Clip& other) const { return !(*this == other); }

private:
    friend class Timeline;

    QString m_name;
    QString m_mediaRef;
    MediaHandle m_media = kInvalidMedia;
    int m_track = -1;

    qint64 m_timelineStart = 0;
    qint64 m_duration = 0;
    qint64 m_sourceIn = 0;
};

} // namespace JLC
