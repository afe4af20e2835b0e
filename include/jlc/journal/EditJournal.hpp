#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace jlc::journal {

// One accepted clip edit, as written to the JSONL edit journal.
struct EditEvent {
    std::string sequence;
    int boundary{0};
    std::int64_t frame{0};
    std::string mode;
    std::string clip;
    int handle{-1};
    std::string edge;
    std::int64_t delta{0};
    std::int64_t startBefore{0};
    std::int64_t durationBefore{0};
    std::int64_t sourceInBefore{0};
    std::int64_t startAfter{0};
    std::int64_t durationAfter{0};
    std::int64_t sourceInAfter{0};
    int schemaVersion{1};
};

bool operator==(const EditEvent& a, const EditEvent& b);

// Serialize one event as a single compact JSON line (no trailing newline).
std::string toJsonLine(const EditEvent& event);

// Parse a single JSONL line into an EditEvent. Throws std::exception on failure.
EditEvent parseEditJsonLine(const std::string& line);

// Write all events, one per line. Throws std::runtime_error when the file cannot be written.
void writeJournal(const std::string& path, const std::vector<EditEvent>& events);

// Read a journal written by writeJournal; blank lines are ignored.
std::vector<EditEvent> readJournal(const std::string& path);

// Convenience SHA-256 helper used by checksum folding.
std::string sha256Hex(const std::string& input);

// Deterministic checksum over the canonical JSON lines of the events.
std::string computeJournalChecksum(const std::vector<EditEvent>& events);

}  // namespace jlc::journal
