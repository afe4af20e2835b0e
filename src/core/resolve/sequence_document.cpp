#include "sequence_document.h"

#include <QFile>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QSaveFile>
#include <QXmlStreamReader>

#include <limits>

Q_LOGGING_CATEGORY(jlcDocument, "jlc.resolve.document")

namespace JLC {

namespace {

const QString kVideoTrackVec = QStringLiteral("VideoTrackVec");
const QString kAudioTrackVec = QStringLiteral("AudioTrackVec");
const QString kElement = QStringLiteral("Element");
const QString kTrack = QStringLiteral("Sm2TiTrack");
const QString kItems = QStringLiteral("Items");
const QString kVideoClip = QStringLiteral("Sm2TiVideoClip");
const QString kAudioClip = QStringLiteral("Sm2TiAudioClip");
const QString kName = QStringLiteral("Name");
const QString kMediaRef = QStringLiteral("MediaRef");
const QString kStart = QStringLiteral("Start");
const QString kDuration = QStringLiteral("Duration");
const QString kIn = QStringLiteral("In");

// Clips without a MediaRef get a private media entry with no spare handle
QString mediaIdFor(const QDomElement& clip, int ordinal)
{
    const QString ref = clip.firstChildElement(kMediaRef).text().trimmed();
    if (!ref.isEmpty()) {
        return ref;
    }
    return QStringLiteral("unlinked-clip-%1").arg(ordinal);
}

// Start + Duration and In + Duration + tail handle must stay representable
bool timingInRange(qint64 start, qint64 duration, qint64 in, qint64 tailHandle)
{
    const qint64 limit = std::numeric_limits<qint64>::max();
    return duration <= limit - start
        && duration <= limit - in
        && tailHandle <= limit - in - duration;
}

} // namespace

bool SequenceDocument::isSequenceContainer(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return false;
    }

    QXmlStreamReader reader(&file);
    while (!reader.atEnd()) {
        if (reader.readNext() == QXmlStreamReader::StartElement) {
            return reader.name() == QLatin1String(cutconst::SEQUENCE_ROOT_TAG);
        }
    }
    return false;
}

Result<SequenceDocument> SequenceDocument::load(const QString& path, const ParseOptions& options)
{
    QFile file(path);
    if (!file.exists()) {
        return Error::file_not_found(path);
    }
    if (!file.open(QIODevice::ReadOnly)) {
        return Error::io_failed(QStringLiteral("Cannot open %1: %2").arg(path, file.errorString()));
    }

    Result<SequenceDocument> loaded = fromXml(file.readAll(), QFileInfo(path).completeBaseName(), options);
    if (loaded.is_ok()) {
        loaded.value().m_path = path;
    }
    return loaded;
}

Result<SequenceDocument> SequenceDocument::fromXml(const QByteArray& xml, const QString& name,
                                                   const ParseOptions& options)
{
    SequenceDocument document;

    QString message;
    int line = 0;
    int column = 0;
    if (!document.m_document.setContent(xml, &message, &line, &column)) {
        return Error::parse_failed(QStringLiteral("Malformed XML in %1 at %2:%3: %4")
                                       .arg(name, QString::number(line), QString::number(column), message));
    }

    Result<void> parsed = document.parse(name, options);
    if (parsed.is_error()) {
        return parsed.error();
    }
    return document;
}

QList<SequenceDocument::TrackMarkup> SequenceDocument::collectTracks(const QDomElement& root,
                                                                     const QString& vectorTag,
                                                                     Track::Kind kind)
{
    QList<TrackMarkup> tracks;
    const QDomElement vector = root.firstChildElement(vectorTag);
    const QString clipTag = kind == Track::Video ? kVideoClip : kAudioClip;
    const QChar prefix = kind == Track::Video ? QLatin1Char('V') : QLatin1Char('A');

    for (QDomElement element = vector.firstChildElement(kElement); !element.isNull();
         element = element.nextSiblingElement(kElement)) {
        const QDomElement trackElement = element.firstChildElement(kTrack);
        if (trackElement.isNull()) {
            continue;
        }

        TrackMarkup track;
        track.kind = kind;
        track.name = QStringLiteral("%1%2").arg(prefix).arg(tracks.size() + 1);

        const QDomElement items = trackElement.firstChildElement(kItems);
        for (QDomElement item = items.firstChildElement(kElement); !item.isNull();
             item = item.nextSiblingElement(kElement)) {
            QDomElement clip = item.firstChildElement(clipTag);
            if (clip.isNull()) {
                // Either clip tag is accepted on either track kind
                clip = item.firstChildElement(kind == Track::Video ? kAudioClip : kVideoClip);
            }
            if (!clip.isNull()) {
                track.clips.append(clip);
            }
        }
        tracks.append(track);
    }
    return tracks;
}

Result<void> SequenceDocument::parse(const QString& name, const ParseOptions& options)
{
    // Algorithm: Check root → Collect tracks → Derive media extents → Build timeline → Validate primary tracks
    const QDomElement root = m_document.documentElement();
    if (root.tagName() != QLatin1String(cutconst::SEQUENCE_ROOT_TAG)) {
        return Error::parse_failed(QStringLiteral("%1 is not a sequence container (root element <%2>)")
                                       .arg(name, root.tagName()));
    }
    if (options.assumedTailHandle < 0) {
        return Error::invalid_arg(QStringLiteral("Assumed tail handle cannot be negative"));
    }

    QList<TrackMarkup> tracks = collectTracks(root, kVideoTrackVec, Track::Video);
    tracks.append(collectTracks(root, kAudioTrackVec, Track::Audio));

    // Media length is not stored; the furthest frame any clip reads bounds it.
    // Bad timing fails the load on the considered tracks and is passed through elsewhere.
    QHash<QString, qint64> extents;
    QStringList mediaOrder;
    int ordinal = 0;
    bool seenVideo = false;
    bool seenAudio = false;
    for (const TrackMarkup& track : tracks) {
        bool& seen = track.kind == Track::Video ? seenVideo : seenAudio;
        const bool considered = !seen;
        seen = true;

        for (const QDomElement& clip : track.clips) {
            const QString id = mediaIdFor(clip, ordinal++);
            const QString clipName = clip.firstChildElement(kName).text();
            const qint64 start = readFrames(clip, kStart);
            const qint64 duration = readFrames(clip, kDuration);
            const qint64 in = readFrames(clip, kIn);
            if (!extents.contains(id)) {
                mediaOrder.append(id);
                extents.insert(id, 0);
            }

            QString problem;
            if (start < 0 || duration < 0 || in < 0) {
                problem = QStringLiteral("has negative timing");
            } else if (!timingInRange(start, duration, in, options.assumedTailHandle)) {
                problem = QStringLiteral("has timing out of range");
            }
            if (!problem.isEmpty()) {
                const QString detail = QStringLiteral("Clip '%1' on %2 in %3 %4 (Start %5, Duration %6, In %7)")
                                           .arg(clipName, track.name, name, problem,
                                                QString::number(start),
                                                QString::number(duration),
                                                QString::number(in));
                if (considered) {
                    return Error::parse_failed(detail);
                }
                qCWarning(jlcDocument, "%s; passing it through", qPrintable(detail));
                continue;
            }
            extents[id] = qMax(extents.value(id), in + duration);
        }
    }

    Timeline timeline(name);
    for (const QString& id : mediaOrder) {
        timeline.addMediaSource(MediaSource(id, extents.value(id) + options.assumedTailHandle));
    }

    QHash<ClipHandle, QDomElement> elements;
    ordinal = 0;
    for (const TrackMarkup& markup : tracks) {
        const int trackIndex = timeline.addTrack(markup.kind == Track::Video ? Track::createVideo(markup.name)
                                                                             : Track::createAudio(markup.name));
        for (const QDomElement& element : markup.clips) {
            const Clip clip = Clip::create(element.firstChildElement(kName).text(),
                                           mediaIdFor(element, ordinal++),
                                           readFrames(element, kStart),
                                           readFrames(element, kDuration),
                                           readFrames(element, kIn));
            const ClipHandle handle = timeline.addClip(trackIndex, clip);
            if (handle == kInvalidClip) {
                return Error::internal(QStringLiteral("Clip '%1' could not be placed on track %2")
                                           .arg(clip.name(), markup.name));
            }
            elements.insert(handle, element);
        }
    }

    Result<void> valid = timeline.validateTracks(timeline.primaryTrackIndices());
    if (valid.is_error()) {
        return Error::parse_failed(QStringLiteral("Sequence %1 is not a usable timeline: %2")
                                       .arg(name, valid.error().message));
    }

    qCDebug(jlcDocument, "Loaded sequence %s: %d track(s), %d clip(s), %d media source(s)",
            qPrintable(name), timeline.trackCount(), timeline.clipCount(), timeline.mediaCount());

    m_timeline = timeline;
    m_clipElements = elements;
    return Result<void>();
}

Result<int> SequenceDocument::syncFromTimeline(const Timeline& edited)
{
    if (edited.clipCount() != m_timeline.clipCount() || edited.trackCount() != m_timeline.trackCount()) {
        return Error::internal(QStringLiteral("Edited timeline does not match the structure of sequence %1")
                                   .arg(name()));
    }

    int rewritten = 0;
    for (auto it = m_clipElements.begin(); it != m_clipElements.end(); ++it) {
        const Clip* original = m_timeline.clip(it.key());
        const Clip* updated = edited.clip(it.key());
        if (updated->name() != original->name() || updated->track() != original->track()) {
            return Error::internal(QStringLiteral("Clip #%1 of sequence %2 changed identity during editing")
                                       .arg(QString::number(it.key()), name()));
        }
        if (updated->timelineStart() == original->timelineStart()
            && updated->duration() == original->duration()
            && updated->sourceIn() == original->sourceIn()) {
            continue;
        }

        const Track* lane = edited.track(updated->track());
        if (!lane->isAudio()) {
            qCWarning(jlcDocument, "Ignoring timing change on %s clip %s",
                      trackKindName(lane->kind()), qPrintable(updated->name()));
            continue;
        }

        writeFrames(it.value(), kStart, updated->timelineStart());
        writeFrames(it.value(), kDuration, updated->duration());
        writeFrames(it.value(), kIn, updated->sourceIn());
        ++rewritten;

        qCDebug(jlcDocument, "Rewrote %s: Start %lld Duration %lld In %lld",
                qPrintable(updated->name()), updated->timelineStart(), updated->duration(), updated->sourceIn());
    }

    m_timeline = edited;
    return rewritten;
}

QByteArray SequenceDocument::toXml() const
{
    return m_document.toByteArray(4);
}

Result<void> SequenceDocument::save(const QString& path) const
{
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        return Error::io_failed(QStringLiteral("Cannot write %1: %2").arg(path, file.errorString()));
    }

    const QByteArray xml = toXml();
    if (file.write(xml) != xml.size() || !file.commit()) {
        return Error::io_failed(QStringLiteral("Failed to save %1: %2").arg(path, file.errorString()));
    }

    qCInfo(jlcDocument, "Saved sequence %s", qPrintable(path));
    return Result<void>();
}

qint64 SequenceDocument::readFrames(const QDomElement& clip, const QString& property)
{
    const QDomElement element = clip.firstChildElement(property);
    if (element.isNull()) {
        return 0;
    }

    bool ok = false;
    const qint64 value = element.text().trimmed().toLongLong(&ok);
    return ok ? value : 0;
}

void SequenceDocument::writeFrames(QDomElement& clip, const QString& property, qint64 value)
{
    QDomElement element = clip.firstChildElement(property);
    if (element.isNull()) {
        element = clip.ownerDocument().createElement(property);
        clip.appendChild(element);
    }

    // Replace text children only; attributes and comments stay
    QDomNode child = element.firstChild();
    while (!child.isNull()) {
        QDomNode next = child.nextSibling();
        if (child.isText()) {
            element.removeChild(child);
        }
        child = next;
    }
    element.appendChild(clip.ownerDocument().createTextNode(QString::number(value)));
}

} // namespace JLC
