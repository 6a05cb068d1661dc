/**
 * @file HttpTransport.hpp
 * @brief Request/response channel used by the generator client.
 */

#pragma once

#include <map>
#include <string>

namespace variantwalker::infrastructure {

/**
 * @struct HttpResponse
 * @brief Outcome of one POST. status is 0 when no response arrived (error holds the cause).
 */
struct HttpResponse {
    int status = 0;
    std::string body;
    std::string error;
};

class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /**
     * @brief Sends a JSON POST request and blocks until response or timeout.
     * @param url Full endpoint URL (scheme://host[:port]/path).
     * @param body Serialized JSON payload.
     * @param headers Extra request headers (e.g. Authorization).
     * @param timeoutMs Connection and read timeout.
     */
    virtual HttpResponse post(const std::string& url,
                              const std::string& body,
                              const std::map<std::string, std::string>& headers,
                              int timeoutMs) = 0;
};

} // namespace variantwalker::infrastructure
