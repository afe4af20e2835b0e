#include "timeline.h"

#include <QLoggingCategory>

#include <algorithm>

Q_LOGGING_CATEGORY(jlcTimeline, "jlc.models.timeline")

namespace JLC {

Timeline::Timeline(const QString& name)
    : m_name(name)
{
}

MediaHandle Timeline::addMediaSource(const MediaSource& media)
{
    MediaHandle existing = findMedia(media.id());
    if (existing != kInvalidMedia) {
        qCDebug(jlcTimeline, "Media source already registered: %s", qPrintable(media.id()));
        return existing;
    }

    m_media.append(media);
    return static_cast<MediaHandle>(m_media.size() - 1);
}

MediaHandle Timeline::findMedia(const QString& id) const
{
    for (int i = 0; i < m_media.size(); ++i) {
        if (m_media[i].id() == id) {
            return i;
        }
    }
    return kInvalidMedia;
}

const MediaSource* Timeline::mediaSource(MediaHandle handle) const
{
    if (handle < 0 || handle >= m_media.size()) {
        return nullptr;
    }
    return &m_media[handle];
}

int Timeline::addTrack(const Track& track)
{
    Track stored = track;
    stored.m_clips.clear();
    m_tracks.append(stored);

    qCDebug(jlcTimeline, "Added %s track %s at index %lld",
            trackKindName(track.kind()), qPrintable(track.name()), (long long)(m_tracks.size() - 1));
    return static_cast<int>(m_tracks.size() - 1);
}

const Track* Timeline::track(int index) const
{
    if (index < 0 || index >= m_tracks.size()) {
        return nullptr;
    }
    return &m_tracks[index];
}

int Timeline::primaryTrackIndex(Track::Kind kind) const
{
    for (int i = 0; i < m_tracks.size(); ++i) {
        if (m_tracks[i].kind() == kind) {
            return i;
        }
    }
    return -1;
}

ClipHandle Timeline::addClip(int trackIndex, const Clip& clip)
{
    // Algorithm: Resolve track → Resolve media by ref → Store in arena → Insert ordered
    if (trackIndex < 0 || trackIndex >= m_tracks.size()) {
        qCWarning(jlcTimeline, "Cannot add clip %s: no track at index %d", qPrintable(clip.name()), trackIndex);
        return kInvalidClip;
    }

    MediaHandle media = findMedia(clip.mediaRef());
    if (media == kInvalidMedia) {
        qCWarning(jlcTimeline, "Cannot add clip %s: unknown media %s", qPrintable(clip.name()), qPrintable(clip.mediaRef()));
        return kInvalidClip;
    }

    Clip stored = clip;
    stored.m_media = media;
    stored.m_track = trackIndex;
    m_clips.append(stored);

    ClipHandle handle = static_cast<ClipHandle>(m_clips.size() - 1);
    Track& track = m_tracks[trackIndex];
    auto position = std::upper_bound(track.m_clips.begin(), track.m_clips.end(), stored.timelineStart(),
                                     [this](qint64 start, ClipHandle other) {
                                         return start < m_clips[other].timelineStart();
                                     });
    track.m_clips.insert(position, handle);
    return handle;
}

const Clip* Timeline::clip(ClipHandle handle) const
{
    if (handle < 0 || handle >= m_clips.size()) {
        return nullptr;
    }
    return &m_clips[handle];
}

QList<const Clip*> Timeline::clipsOnTrack(int trackIndex) const
{
    QList<const Clip*> clips;
    const Track* lane = track(trackIndex);
    if (!lane) {
        return clips;
    }

    for (ClipHandle handle : lane->clips()) {
        clips.append(&m_clips[handle]);
    }
    return clips;
}

bool Timeline::retimeClip(ClipHandle handle, qint64 timelineStart, qint64 duration, qint64 sourceIn)
{
    if (handle < 0 || handle >= m_clips.size()) {
        return false;
    }

    Clip& target = m_clips[handle];
    target.m_timelineStart = timelineStart;
    target.m_duration = duration;
    target.m_sourceIn = sourceIn;

    if (target.m_track >= 0 && target.m_track < m_tracks.size()) {
        sortTrack(m_tracks[target.m_track]);
    }
    return true;
}

Result<void> Timeline::validate() const
{
    QList<int> all;
    for (int i = 0; i < m_tracks.size(); ++i) {
        all.append(i);
    }
    return validateTracks(all);
}

Result<void> Timeline::validateTracks(const QList<int>& trackIndices) const
{
    for (int index : trackIndices) {
        const Track* lane = track(index);
        if (!lane) {
            return Error::internal(QStringLiteral("No track at index %1").arg(index));
        }

        for (ClipHandle handle : lane->m_clips) {
            Result<void> clipCheck = validateClip(m_clips[handle]);
            if (clipCheck.is_error()) {
                return clipCheck;
            }
        }

        Result<void> trackCheck = validateTrack(*lane);
        if (trackCheck.is_error()) {
            return trackCheck;
        }
    }
    return Result<void>();
}

QList<int> Timeline::primaryTrackIndices() const
{
    QList<int> indices;
    for (Track::Kind kind : {Track::Video, Track::Audio}) {
        const int index = primaryTrackIndex(kind);
        if (index >= 0) {
            indices.append(index);
        }
    }
    return indices;
}

bool Timeline::operator==(const Timeline& other) const
{
    return m_name == other.m_name
        && m_media == other.m_media
        && m_tracks == other.m_tracks
        && m_clips == other.m_clips;
}

void Timeline::sortTrack(Track& track)
{
    std::stable_sort(track.m_clips.begin(), track.m_clips.end(),
                     [this](ClipHandle a, ClipHandle b) {
                         return m_clips[a].timelineStart() < m_clips[b].timelineStart();
                     });
}

Result<void> Timeline::validateTrack(const Track& track) const
{
    for (int i = 0; i + 1 < track.m_clips.size(); ++i) {
        const Clip& current = m_clips[track.m_clips[i]];
        const Clip& next = m_clips[track.m_clips[i + 1]];
        if (current.timelineEnd() > next.timelineStart()) {
            return Error::internal(QStringLiteral("Clips '%1' and '%2' overlap on %3 track %4 (%5 > %6)")
                                       .arg(current.name(), next.name(),
                                            QLatin1String(trackKindName(track.kind())), track.name(),
                                            QString::number(current.timelineEnd()),
                                            QString::number(next.timelineStart())));
        }
    }
    return Result<void>();
}

Result<void> Timeline::validateClip(const Clip& clip) const
{
    if (clip.timelineStart() < 0 || clip.duration() < 0) {
        return Error::internal(QStringLiteral("Clip '%1' has a negative position or duration").arg(clip.name()));
    }

    const MediaSource* media = mediaSource(clip.media());
    if (!media) {
        return Error::internal(QStringLiteral("Clip '%1' references unknown media %2")
                                   .arg(clip.name(), clip.mediaRef()));
    }

    if (!media->contains(clip.sourceIn(), clip.sourceOut())) {
        return Error::internal(QStringLiteral("Clip '%1' reads [%2, %3) outside media %4 of length %5")
                                   .arg(clip.name(),
                                        QString::number(clip.sourceIn()),
                                        QString::number(clip.sourceOut()),
                                        media->id(),
                                        QString::number(media->length())));
    }
    return Result<void>();
}

} // namespace JLC
