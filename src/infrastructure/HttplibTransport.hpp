/**
 * @file HttplibTransport.hpp
 * @brief cpp-httplib implementation of HttpTransport.
 */

#pragma once

#include <string>
#include "infrastructure/HttpTransport.hpp"

namespace variantwalker::infrastructure {

class HttplibTransport : public HttpTransport {
public:
    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::map<std::string, std::string>& headers,
                      int timeoutMs) override;

    /**
     * @brief Splits "https://host:8080/v1/gen" into ("https://host:8080", "/v1/gen").
     * @return false if the URL has no scheme or host.
     */
    static bool SplitUrl(const std::string& url, std::string& schemeHostPort, std::string& path);
};

} // namespace variantwalker::infrastructure
