/**
 * @file ArchiveRecord.hpp
 * @brief Value Object holding the full audit trail of one generation attempt.
 */

#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace variantwalker::domain {

/**
 * @struct ArchiveRecord
 * @brief Everything needed to reproduce or inspect a run for one target.
 * Fields that a failed attempt never reached stay null.
 */
struct ArchiveRecord {
    std::string timestamp; ///< ISO-8601 local time.
    std::string sequenceId;
    int messageId = 0;
    std::string contentKey;
    std::string targetFile;
    bool writeMode = false;

    nlohmann::json config;
    nlohmann::json state;
    nlohmann::json resolvedPath;
    bool reachedTarget = false;
    nlohmann::json context;
    std::vector<std::string> siblingExemplars;
    std::vector<std::string> existingVariants;
    nlohmann::json prompt;
    nlohmann::json request;
    nlohmann::json response;
    nlohmann::json verdicts;
    std::vector<std::string> acceptedVariants;

    std::string status = "ok"; ///< "ok" or "failed".
    std::string error;

    nlohmann::json toJson() const {
        nlohmann::json j = {
            {"timestamp", timestamp},
            {"target", {
                {"sequenceId", sequenceId},
                {"messageId", messageId},
                {"contentKey", contentKey},
                {"targetFile", targetFile}
            }},
            {"writeMode", writeMode},
            {"config", config},
            {"state", state},
            {"resolvedPath", {
                {"reachedTarget", reachedTarget},
                {"nodes", resolvedPath}
            }},
            {"context", context},
            {"exemplars", {
                {"siblingSample", siblingExemplars},
                {"existingVariants", existingVariants}
            }},
            {"prompt", prompt},
            {"request", request},
            {"response", response},
            {"verdicts", verdicts},
            {"acceptedVariants", acceptedVariants},
            {"outcome", {{"status", status}}}
        };
        if (!error.empty()) j["outcome"]["error"] = error;
        return j;
    }
};

} // namespace variantwalker::domain
