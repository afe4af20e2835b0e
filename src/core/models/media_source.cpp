#include "media_source.h"

namespace JLC {

MediaSource::MediaSource(const QString& id, qint64 length)
    : m_id(id)
    , m_length(length)
{
}

bool MediaSource::contains(qint64 in, qint64 out) const
{
    return in >= 0 && out >= in && out <= m_length;
}

bool MediaSource::operator==(const MediaSource& other) const
{
    return m_id == other.m_id && m_length == other.m_length;
}

} // namespace JLC
