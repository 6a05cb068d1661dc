/**
 * @file ArchiveWriter.hpp
 * @brief Persists audit records under a date-sharded directory tree.
 */

#pragma once

#include <chrono>
#include <string>
#include "domain/ArchiveRecord.hpp"

namespace variantwalker::infrastructure {

/**
 * @class ArchiveWriter
 * @brief Writes <archiveDir>/YYYY/MM/DD/<epoch-millis>_<hash>.json atomically (temp -> rename).
 * An existing file is never overwritten; a "_<n>" suffix is added instead.
 */
class ArchiveWriter {
public:
    explicit ArchiveWriter(const std::string& archiveDir);

    /**
     * @brief Serializes the record with 2-space indentation.
     * @return Path of the written file.
     * @throws domain::StructuralError if the file cannot be written.
     */
    std::string write(const domain::ArchiveRecord& record,
                      std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const;

    /** @brief djb2 over "<seq>:<msg>:<contentKey>", absolute value, decimal. */
    static std::string HashTargetId(const std::string& sequenceId, int messageId, const std::string& contentKey);

    /** @brief <base>/YYYY/MM/DD for the local date of the time point. */
    static std::string ShardDir(const std::string& base, std::chrono::system_clock::time_point time);

    /** @brief Local ISO-8601 timestamp ("2024-03-01T08:15:30"). */
    static std::string IsoTimestamp(std::chrono::system_clock::time_point time);

private:
    std::string m_archiveDir;
};

} // namespace variantwalker::infrastructure
