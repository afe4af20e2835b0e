#include "track.h"

#include <QLoggingCategory>

Q_LOGGING_CATEGORY(jlcTrack, "jlc.models.track")

namespace JLC {

Track Track::createVideo(const QString& name)
{
    Track track;
    track.m_name = name;
    track.m_kind = Video;

    qCDebug(jlcTrack, "Created video track: %s", qPrintable(name));
    return track;
}

Track Track::createAudio(const QString& name)
{
    Track track;
    track.m_name = name;
    track.m_kind = Audio;

    qCDebug(jlcTrack, "Created audio track: %s", qPrintable(name));
    return track;
}

bool Track::operator==(const Track& other) const
{
    return m_name == other.m_name && m_kind == other.m_kind && m_clips == other.m_clips;
}

const char* trackKindName(Track::Kind kind)
{
    switch (kind) {
    case Track::Video: return "video";
    case Track::Audio: return "audio";
    }
    return "unknown";
}

} // namespace JLC
