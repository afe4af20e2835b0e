#include "run_config.h"

#include <QFileInfo>
#include <QLoggingCategory>
#include <QSettings>

#include <limits>

Q_LOGGING_CATEGORY(jlcConfig, "jlc.config")

namespace JLC {

namespace {

// Missing keys keep `fallback`; present keys must be integers
Result<qint64> readInteger(const QSettings& settings, const QString& key, qint64 fallback)
{
    if (!settings.contains(key)) {
        return fallback;
    }

    bool ok = false;
    const qint64 value = settings.value(key).toString().trimmed().toLongLong(&ok);
    if (!ok) {
        return Error::invalid_arg(QStringLiteral("Setting %1 is not an integer: %2")
                                      .arg(key, settings.value(key).toString()));
    }
    return value;
}

} // namespace

Result<RunConfig> RunConfig::fromSettings(const QString& iniPath)
{
    if (!QFileInfo(iniPath).isFile()) {
        return Error::file_not_found(iniPath);
    }

    QSettings settings(iniPath, QSettings::IniFormat);
    if (settings.status() != QSettings::NoError) {
        return Error::parse_failed(QStringLiteral("Cannot read settings from %1").arg(iniPath));
    }

    RunConfig config;
    const QString cuts = QLatin1String(cutconst::SETTINGS_GROUP_CUTS) + QLatin1Char('/');
    const QString archive = QLatin1String(cutconst::SETTINGS_GROUP_ARCHIVE) + QLatin1Char('/');

    const QString modeKey = cuts + QStringLiteral("mode");
    if (settings.contains(modeKey) && !parseCutMode(settings.value(modeKey).toString(), &config.mode)) {
        return Error::invalid_arg(QStringLiteral("Setting %1 must be J or L, got %2")
                                      .arg(modeKey, settings.value(modeKey).toString()));
    }
    config.dryRun = settings.value(cuts + QStringLiteral("dry_run"), config.dryRun).toBool();

    struct IntegerSetting {
        QString key;
        qint64* target;
    };
    qint64 timeout = config.archive.processTimeoutMs;
    const IntegerSetting integers[] = {
        {cuts + QStringLiteral("offset"), &config.offsetFrames},
        {cuts + QStringLiteral("max_offset"), &config.maxOffsetFrames},
        {cuts + QStringLiteral("assumed_tail_handle"), &config.assumedTailHandle},
        {archive + QStringLiteral("max_archive_bytes"), &config.archive.maxArchiveBytes},
        {archive + QStringLiteral("max_extracted_bytes"), &config.archive.maxExtractedBytes},
        {archive + QStringLiteral("process_timeout_ms"), &timeout},
    };
    for (const IntegerSetting& setting : integers) {
        Result<qint64> value = readInteger(settings, setting.key, *setting.target);
        if (value.is_error()) {
            return value.error();
        }
        *setting.target = value.value();
    }
    if (timeout <= 0 || timeout > std::numeric_limits<int>::max()) {
        return Error::invalid_arg(QStringLiteral("Setting %1process_timeout_ms is out of range").arg(archive));
    }
    config.archive.processTimeoutMs = static_cast<int>(timeout);

    qCDebug(jlcConfig, "Loaded %s: %s-cuts, offset %lld, max offset %lld",
            qPrintable(iniPath), cutModeName(config.mode), config.offsetFrames, config.maxOffsetFrames);
    return config;
}

Result<void> RunConfig::validate() const
{
    if (maxOffsetFrames < cutconst::MIN_OFFSET_FRAMES) {
        return Error::invalid_arg(QStringLiteral("Maximum offset must be at least %1 frame(s)")
                                      .arg(cutconst::MIN_OFFSET_FRAMES));
    }
    if (offsetFrames < cutconst::MIN_OFFSET_FRAMES) {
        return Error::invalid_arg(QStringLiteral("Offset must be a positive number of frames (got %1)")
                                      .arg(offsetFrames));
    }
    if (offsetFrames > maxOffsetFrames) {
        return Error::invalid_arg(QStringLiteral("Offset too large: %1 frames (max %2)")
                                      .arg(QString::number(offsetFrames), QString::number(maxOffsetFrames)));
    }
    if (assumedTailHandle < 0) {
        return Error::invalid_arg(QStringLiteral("Assumed tail handle cannot be negative (got %1)")
                                      .arg(assumedTailHandle));
    }
    if (archive.maxArchiveBytes <= 0 || archive.maxExtractedBytes <= 0) {
        return Error::invalid_arg(QStringLiteral("Archive size limits must be positive"));
    }
    return Result<void>();
}

CutParameters RunConfig::cutParameters() const
{
    CutParameters parameters;
    parameters.offsetFrames = offsetFrames;
    parameters.mode = mode;
    parameters.dryRun = dryRun;
    return parameters;
}

} // namespace JLC
