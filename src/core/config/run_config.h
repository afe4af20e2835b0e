#pragma once

#include "../common/cut_constants.h"
#include "../common/cut_errors.h"
#include "../cuts/boundary.h"
#include "../resolve/project_archive.h"

#include <QString>

namespace JLC {

/**
 * RunConfig - everything one jlcut invocation needs
 *
 * Defaults come from cutconst; an optional INI file overrides them:
 *
 *   [cuts]
 *   mode=J
 *   offset=8
 *   max_offset=100
 *   assumed_tail_handle=0
 *   dry_run=false
 *
 *   [archive]
 *   max_archive_bytes=52428800
 *   max_extracted_bytes=209715200
 *   process_timeout_ms=30000
 *
 * Command-line options are applied on top by the caller, then validate() runs.
 */
struct RunConfig {
    CutMode mode = CutMode::J;
    qint64 offsetFrames = cutconst::DEFAULT_OFFSET_FRAMES;
    qint64 maxOffsetFrames = cutconst::DEFAULT_MAX_OFFSET_FRAMES;
    qint64 assumedTailHandle = cutconst::DEFAULT_ASSUMED_TAIL_HANDLE_FRAMES;
    bool dryRun = false;
    ArchiveLimits archive;
    QString outputDirectory;   // empty = beside the input
    QString journalPath;       // empty = no journal

    static Result<RunConfig> fromSettings(const QString& iniPath);

    Result<void> validate() const;

    CutParameters cutParameters() const;
};

} // namespace JLC
