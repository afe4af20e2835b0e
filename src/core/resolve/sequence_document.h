#pragma once

#include "../common/cut_constants.h"
#include "../common/cut_errors.h"
#include "../models/timeline.h"

#include <QByteArray>
#include <QDomDocument>
#include <QDomElement>
#include <QHash>
#include <QList>
#include <QString>
#include <QStringList>

namespace JLC {

/**
 * SequenceDocument - one Resolve sequence container and the Timeline read from it
 *
 * Markup shape:
 *   Sm2SequenceContainer
 *     VideoTrackVec/Element/Sm2TiTrack/Items/Element/Sm2TiVideoClip
 *     AudioTrackVec/Element/Sm2TiTrack/Items/Element/Sm2TiAudioClip
 * Clip elements carry Name, MediaRef, Start, Duration, In children.
 * The DOM is kept alongside the Timeline so write-back touches only the
 * timing children of clips that changed.
 */
class SequenceDocument
{
public:
    struct ParseOptions {
        qint64 assumedTailHandle = cutconst::DEFAULT_ASSUMED_TAIL_HANDLE_FRAMES;
    };

    SequenceDocument() = default;

    // Root-tag check used when scanning an extracted project
    static bool isSequenceContainer(const QString& path);

    static Result<SequenceDocument> load(const QString& path, const ParseOptions& options = ParseOptions());
    static Result<SequenceDocument> fromXml(const QByteArray& xml, const QString& name,
                                            const ParseOptions& options = ParseOptions());

    QString path() const { return m_path; }
    QString name() const { return m_timeline.name(); }
    const Timeline& timeline() const { return m_timeline; }

    /**
     * Copy timing of changed clips from `edited` into the markup
     * Algorithm: Match clip handles → Diff timing → Rewrite Start/Duration/In
     * Returns the number of clip elements rewritten
     */
    Result<int> syncFromTimeline(const Timeline& edited);

    QByteArray toXml() const;
    Result<void> save(const QString& path) const;

private:
    struct TrackMarkup {
        Track::Kind kind = Track::Video;
        QString name;
        QList<QDomElement> clips;
    };

    Result<void> parse(const QString& name, const ParseOptions& options);
    static QList<TrackMarkup> collectTracks(const QDomElement& root, const QString& vectorTag, Track::Kind kind);

    static qint64 readFrames(const QDomElement& clip, const QString& property);
    static void writeFrames(QDomElement& clip, const QString& property, qint64 value);

    QString m_path;
    QDomDocument m_document;
    Timeline m_timeline;
    QHash<ClipHandle, QDomElement> m_clipElements;
};

} // namespace JLC
