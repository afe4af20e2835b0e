#pragma once

#include "clip.h"
#include "media_source.h"
#include "track.h"
#include "../common/cut_errors.h"

#include <QList>
#include <QString>

namespace JLC {

/**
 * Timeline - arena owning every clip, media source and track of one sequence
 *
 * Clips and media sources are addressed by stable integer handles into
 * per-timeline tables, so copies of a Timeline stay self-consistent and no
 * reference dangles after a clip is re-timed. The first Video and first Audio
 * track are the ones the cut engine considers; further tracks ride along.
 */
class Timeline
{
public:
    Timeline() = default;
    explicit Timeline(const QString& name);

    QString name() const { return m_name; }

    // Media table
    MediaHandle addMediaSource(const MediaSource& media);
    MediaHandle findMedia(const QString& id) const;
    const MediaSource* mediaSource(MediaHandle handle) const;
    int mediaCount() const { return static_cast<int>(m_media.size()); }

    // Tracks
    int addTrack(const Track& track);
    int trackCount() const { return static_cast<int>(m_tracks.size()); }
    const Track* track(int index) const;
    int primaryTrackIndex(Track::Kind kind) const;
    const Track* videoTrack() const { return track(primaryTrackIndex(Track::Video)); }
    const Track* audioTrack() const { return track(primaryTrackIndex(Track::Audio)); }

    /**
     * Place clip on a track
     * Algorithm: Resolve track → Resolve media by ref → Store in arena → Insert ordered
     * Returns kInvalidClip when the track or media reference does not resolve
     */
    ClipHandle addClip(int trackIndex, const Clip& clip);
    const Clip* clip(ClipHandle handle) const;
    int clipCount() const { return static_cast<int>(m_clips.size()); }
    QList<const Clip*> clipsOnTrack(int trackIndex) const;

    // Re-time a clip; keeps its track ordered
    bool retimeClip(ClipHandle handle, qint64 timelineStart, qint64 duration, qint64 sourceIn);

    // First violated model invariant, if any
    Result<void> validate() const;

    // Same checks, limited to the clips and ordering of the given tracks
    Result<void> validateTracks(const QList<int>& trackIndices) const;

    // First video and first audio track, when present
    QList<int> primaryTrackIndices() const;

    bool operator==(const Timeline& other) const;
    bool operator!=(const Timeline& other) const { return !(*this == other); }

private:
    void sortTrack(Track& track);
    Result<void> validateTrack(const Track& track) const;
    Result<void> validateClip(const Clip& clip) const;

    QString m_name;
    QList<MediaSource> m_media;
    QList<Track> m_tracks;
    QList<Clip> m_clips;
};

} // namespace JLC
