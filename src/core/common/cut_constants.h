#pragma once

/**
 * Default limits and naming for JLCut runs
 * All tunables used by the config layer start from these values (Rule 2.14)
 */

namespace cutconst {

// Offsets
static const long long MIN_OFFSET_FRAMES = 1;
static const long long DEFAULT_MAX_OFFSET_FRAMES = 100;
static const long long DEFAULT_OFFSET_FRAMES = 8;

// A trimmed clip keeps at least this many frames
static const long long MIN_CLIP_DURATION_FRAMES = 1;

// Handle assumed past the furthest known out-point of a media source
static const long long DEFAULT_ASSUMED_TAIL_HANDLE_FRAMES = 0;

// Archive limits
static const long long DEFAULT_MAX_ARCHIVE_BYTES = 50LL * 1024 * 1024;
static const long long DEFAULT_MAX_EXTRACTED_BYTES = 200LL * 1024 * 1024;
static const int DEFAULT_PROCESS_TIMEOUT_MS = 30000;

// Project archive layout
static const char* const PROJECT_ARCHIVE_SUFFIX = "drp";
static const char* const PROJECT_MANIFEST_FILE = "project.xml";
static const char* const SEQUENCE_DIRECTORY = "SeqContainer";
static const char* const SEQUENCE_ROOT_TAG = "Sm2SequenceContainer";

// External archive tools
static const char* const ZIP_TOOL = "zip";
static const char* const UNZIP_TOOL = "unzip";

// Output naming
static const char* const J_CUT_OUTPUT_SUFFIX = " (J cuts added)";
static const char* const L_CUT_OUTPUT_SUFFIX = " (L cuts added)";

// Settings groups and keys
static const char* const SETTINGS_GROUP_CUTS = "cuts";
static const char* const SETTINGS_GROUP_ARCHIVE = "archive";

} // namespace cutconst
