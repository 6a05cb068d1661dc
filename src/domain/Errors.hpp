/**
 * @file Errors.hpp
 * @brief Exception types raised by the variant pipeline.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <nlohmann/json.hpp>

namespace variantwalker::domain {

/**
 * @class StructuralError
 * @brief Malformed input: bad content key, missing node, bad config/state shape.
 * Fails a single target; the batch continues unless fail-fast is set.
 */
class StructuralError : public std::runtime_error {
public:
    explicit StructuralError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @class ConfigParseError
 * @brief Raised by the indentation-based config parser, with the offending line.
 */
class ConfigParseError : public StructuralError {
public:
    ConfigParseError(const std::string& message, int line)
        : StructuralError("line " + std::to_string(line) + ": " + message), m_line(line) {}

    int line() const { return m_line; }

private:
    int m_line;
};

/**
 * @class GenerationError
 * @brief Generation backend failure that survived retries (or cannot be retried).
 */
class GenerationError : public std::runtime_error {
public:
    explicit GenerationError(const std::string& message, nlohmann::json request = nullptr)
        : std::runtime_error(message), m_request(std::move(request)) {}

    /** @brief Last payload built for the backend, null if none was built. */
    const nlohmann::json& request() const { return m_request; }

private:
    nlohmann::json m_request;
};

} // namespace variantwalker::domain
