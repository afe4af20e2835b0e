#include "jlc/journal/EditJournal.hpp"

#include <nlohmann/json.hpp>
#include <openssl/evp.h>

#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace jlc::journal {

bool operator==(const EditEvent& a, const EditEvent& b) {
    return a.sequence == b.sequence && a.boundary == b.boundary && a.frame == b.frame &&
           a.mode == b.mode && a.clip == b.clip && a.handle == b.handle && a.edge == b.edge &&
           a.delta == b.delta && a.startBefore == b.startBefore &&
           a.durationBefore == b.durationBefore && a.sourceInBefore == b.sourceInBefore &&
           a.startAfter == b.startAfter && a.durationAfter == b.durationAfter &&
           a.sourceInAfter == b.sourceInAfter && a.schemaVersion == b.schemaVersion;
}

std::string toJsonLine(const EditEvent& event) {
    json line;
    line["schema"] = event.schemaVersion;
    line["sequence"] = event.sequence;
    line["boundary"] = event.boundary;
    line["frame"] = event.frame;
    line["mode"] = event.mode;
    line["clip"] = event.clip;
    line["handle"] = event.handle;
    line["edge"] = event.edge;
    line["delta"] = event.delta;
    line["before"] = {{"start", event.startBefore},
                      {"duration", event.durationBefore},
                      {"src_in", event.sourceInBefore}};
    line["after"] = {{"start", event.startAfter},
                     {"duration", event.durationAfter},
                     {"src_in", event.sourceInAfter}};
    return line.dump();
}

EditEvent parseEditJsonLine(const std::string& line) {
    json parsed = json::parse(line);
    EditEvent event;
    event.schemaVersion = parsed.value("schema", 1);
    event.sequence = parsed.value("sequence", "");
    event.boundary = parsed.at("boundary").get<int>();
    event.frame = parsed.at("frame").get<std::int64_t>();
    event.mode = parsed.at("mode").get<std::string>();
    event.clip = parsed.value("clip", "");
    event.handle = parsed.value("handle", -1);
    event.edge = parsed.at("edge").get<std::string>();
    if (event.edge != "head" && event.edge != "tail") {
        throw std::runtime_error("parseEditJsonLine: unknown edge '" + event.edge + "'");
    }
    event.delta = parsed.at("delta").get<std::int64_t>();

    const json& before = parsed.at("before");
    event.startBefore = before.at("start").get<std::int64_t>();
    event.durationBefore = before.at("duration").get<std::int64_t>();
    event.sourceInBefore = before.at("src_in").get<std::int64_t>();

    const json& after = parsed.at("after");
    event.startAfter = after.at("start").get<std::int64_t>();
    event.durationAfter = after.at("duration").get<std::int64_t>();
    event.sourceInAfter = after.at("src_in").get<std::int64_t>();
    return event;
}

void writeJournal(const std::string& path, const std::vector<EditEvent>& events) {
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("writeJournal: cannot open " + path);
    }
    for (const EditEvent& event : events) {
        out << toJsonLine(event) << '\n';
    }
    out.flush();
    if (!out) {
        throw std::runtime_error("writeJournal: failed writing " + path);
    }
}

std::vector<EditEvent> readJournal(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("readJournal: cannot open " + path);
    }

    std::vector<EditEvent> events;
    std::string line;
    std::size_t lineNumber = 0;
    while (std::getline(in, line)) {
        ++lineNumber;
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        try {
            events.push_back(parseEditJsonLine(line));
        } catch (const std::exception& ex) {
            throw std::runtime_error(path + ":" + std::to_string(lineNumber) + ": " + ex.what());
        }
    }
    return events;
}

std::string sha256Hex(const std::string& input) {
    const EVP_MD* md = EVP_sha256();
    if (md == nullptr) {
        throw std::runtime_error("EVP_sha256 unavailable");
    }

    EVP_MD_CTX* context = EVP_MD_CTX_new();
    if (context == nullptr) {
        throw std::runtime_error("Failed to allocate EVP_MD_CTX");
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_length = 0;

    if (EVP_DigestInit_ex(context, md, nullptr) != 1 ||
        EVP_DigestUpdate(context, input.data(), input.size()) != 1 ||
        EVP_DigestFinal_ex(context, hash, &hash_length) != 1) {
        EVP_MD_CTX_free(context);
        throw std::runtime_error("Failed to compute SHA-256 digest");
    }
    EVP_MD_CTX_free(context);

    std::ostringstream oss;
    for (unsigned int i = 0; i < hash_length; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return oss.str();
}

std::string computeJournalChecksum(const std::vector<EditEvent>& events) {
    std::string canonical;
    for (const EditEvent& event : events) {
        canonical += toJsonLine(event);
        canonical += '\n';
    }
    return sha256Hex(canonical);
}

}  // namespace jlc::journal
