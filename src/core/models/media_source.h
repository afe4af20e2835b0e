#pragma once

#include <QString>
#include <QtGlobal>

namespace JLC {

// Stable index into Timeline's media table
using MediaHandle = int;
constexpr MediaHandle kInvalidMedia = -1;

/**
 * MediaSource - the full recorded extent of one media file
 * Frames [0, length) are available to any clip referencing it; immutable once loaded
 */
class MediaSource
{
public:
    MediaSource() = default;
    MediaSource(const QString& id, qint64 length);

    QString id() const { return m_id; }
    qint64 length() const { return m_length; }

    // True when [in, out) lies inside the recorded range
    bool contains(qint64 in, qint64 out) const;

    // Unused frames before `in` / after `out`
    qint64 headHandle(qint64 in) const { return in; }
    qint64 tailHandle(qint64 out) const { return m_length - out; }

    bool isValid() const { return !m_id.isEmpty() && m_length >= 0; }

    bool operator==(const MediaSource& other) const;
    bool operator!=(const MediaSource& other) const { return !(*this == other); }

private:
    QString m_id;
    qint64 m_length = 0;
};

} // namespace JLC
