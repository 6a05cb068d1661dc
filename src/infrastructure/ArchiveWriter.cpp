/**
 * @file ArchiveWriter.cpp
 * @brief Implementation of ArchiveWriter.
 */

#include "infrastructure/ArchiveWriter.hpp"
#include "domain/Errors.hpp"
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;

namespace variantwalker::infrastructure {

namespace {

std::tm ToLocalTime(std::time_t tt) {
    std::tm tm = {};
#if defined(_WIN32)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    return tm;
}

std::string Format(std::chrono::system_clock::time_point time, const char* pattern) {
    std::tm tm = ToLocalTime(std::chrono::system_clock::to_time_t(time));
    char buf[64];
    std::strftime(buf, sizeof(buf), pattern, &tm);
    return buf;
}

} // namespace

ArchiveWriter::ArchiveWriter(const std::string& archiveDir)
    : m_archiveDir(archiveDir) {}

std::string ArchiveWriter::HashTargetId(const std::string& sequenceId, int messageId, const std::string& contentKey) {
    std::string input = sequenceId + ":" + std::to_string(messageId) + ":" + contentKey;
    uint64_t hash = 5381;
    for (unsigned char c : input) {
        hash = (hash << 5) + hash + c;
    }
    int64_t signedHash = static_cast<int64_t>(hash);
    uint64_t magnitude = signedHash < 0 ? (~hash + 1) : hash;
    return std::to_string(magnitude);
}

std::string ArchiveWriter::ShardDir(const std::string& base, std::chrono::system_clock::time_point time) {
    return (fs::path(base) / Format(time, "%Y") / Format(time, "%m") / Format(time, "%d")).string();
}

std::string ArchiveWriter::IsoTimestamp(std::chrono::system_clock::time_point time) {
    return Format(time, "%Y-%m-%dT%H:%M:%S");
}

std::string ArchiveWriter::write(const domain::ArchiveRecord& record,
                                 std::chrono::system_clock::time_point now) const {
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
    std::string hash = HashTargetId(record.sequenceId, record.messageId, record.contentKey);

    fs::path shard = ShardDir(m_archiveDir, now);
    std::string stem = std::to_string(millis) + "_" + hash;
    fs::create_directories(shard);

    // Same target twice within one millisecond: keep both records.
    fs::path finalPath = shard / (stem + ".json");
    for (int n = 1; fs::exists(finalPath); ++n) {
        finalPath = shard / (stem + "_" + std::to_string(n) + ".json");
    }
    fs::path tempPath = finalPath;
    tempPath += ".tmp";

    {
        std::ofstream ofs(tempPath);
        if (!ofs.is_open()) {
            throw domain::StructuralError("Failed to open archive file: " + tempPath.string());
        }
        ofs << record.toJson().dump(2) << "\n";
        if (ofs.fail()) {
            ofs.close();
            std::error_code ec;
            fs::remove(tempPath, ec);
            throw domain::StructuralError("Write failed for archive file: " + tempPath.string());
        }
    }

    std::error_code ec;
    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        std::cerr << "[ArchiveWriter] Rename failed: " << ec.message() << std::endl;
        fs::remove(tempPath, ec);
        throw domain::StructuralError("Cannot finalize archive file: " + finalPath.string());
    }
    return finalPath.string();
}

} // namespace variantwalker::infrastructure
