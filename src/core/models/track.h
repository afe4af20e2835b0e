#pragma once

#include "clip.h"

#include <QList>
#include <QString>

namespace JLC {

/**
 * Track entity - an ordered lane of clips of one kind
 * Clips are kept sorted by timelineStart; Timeline owns the clip data
 */
class Track
{
public:
    enum Kind {
        Video,
        Audio
    };

    Track() = default;
    ~Track() = default;

    Track(const Track& other) = default;
    Track& operator=(const Track& other) = default;
    Track(Track&& other) noexcept = default;
    Track& operator=(Track&& other) noexcept = default;

    static Track createVideo(const QString& name);
    static Track createAudio(const QString& name);

    // Core properties
    QString name() const { return m_name; }
    Kind kind() const { return m_kind; }
    bool isVideo() const { return m_kind == Video; }
    bool isAudio() const { return m_kind == Audio; }

    // Clip management
    const QList<ClipHandle>& clips() const { return m_clips; }
    int clipCount() const { return static_cast<int>(m_clips.size()); }
    bool isEmpty() const { return m_clips.isEmpty(); }
    bool containsClip(ClipHandle handle) const { return m_clips.contains(handle); }

    bool operator==(const Track& other) const;
    bool operator!=(const Track& other) const { return !(*this == other); }

private:
    friend class Timeline;

    QString m_name;
    Kind m_kind = Video;
    QList<ClipHandle> m_clips;
};

const char* trackKindName(Track::Kind kind);

} // namespace JLC
