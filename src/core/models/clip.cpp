#include "clip.h"

#include <QLoggingCategory>

Q_LOGGING_CATEGORY(jlcClip, "jlc.models.clip")

namespace JLC {

Clip Clip::create(const QString& name, const QString& mediaRef,
                  qint64 timelineStart, qint64 duration, qint64 sourceIn)
{
    // Algorithm: Store identity → Place on timeline → Set source range
    Clip clip;
    clip.m_name = name;
    clip.m_mediaRef = mediaRef;
    clip.m_timelineStart = timelineStart;
    clip.m_duration = duration;
    clip.m_sourceIn = sourceIn;

    qCDebug(jlcClip) << "Created clip:" << name << "at" << timelineStart << "duration" << duration;
    return clip;
}

void Clip::trimStart(qint64 offset)
{
    m_timelineStart += offset;
    m_sourceIn += offset;
    m_duration -= offset;
}

void Clip::trimEnd(qint64 offset)
{
    m_duration += offset;
}

bool Clip::operator==(const Clip& other) const
{
    return m_name == other.m_name
        && m_mediaRef == other.m_mediaRef
        && m_media == other.m_media
        && m_track == other.m_track
        && m_timelineStart == other.m_timelineStart
        && m_duration == other.m_duration
        && m_sourceIn == other.m_sourceIn;
}

} // namespace JLC
