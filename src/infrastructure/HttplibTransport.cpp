#include "infrastructure/HttplibTransport.hpp"
#include <httplib.h>
#include <chrono>
#include <iostream>

namespace variantwalker::infrastructure {

bool HttplibTransport::SplitUrl(const std::string& url, std::string& schemeHostPort, std::string& path) {
    size_t schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos || schemeEnd == 0) return false;

    size_t hostStart = schemeEnd + 3;
    size_t pathStart = url.find('/', hostStart);
    if (pathStart == hostStart) return false;

    if (pathStart == std::string::npos) {
        if (hostStart >= url.size()) return false;
        schemeHostPort = url;
        path = "/";
    } else {
        schemeHostPort = url.substr(0, pathStart);
        path = url.substr(pathStart);
    }
    return true;
}

HttpResponse HttplibTransport::post(const std::string& url,
                                    const std::string& body,
                                    const std::map<std::string, std::string>& headers,
                                    int timeoutMs) {
    HttpResponse out;
    std::string schemeHostPort;
    std::string path;
    if (!SplitUrl(url, schemeHostPort, path)) {
        out.error = "Invalid URL: " + url;
        return out;
    }

    httplib::Client cli(schemeHostPort);
    if (!cli.is_valid()) {
        out.error = "Unsupported endpoint (is OpenSSL available for https?): " + schemeHostPort;
        return out;
    }
    cli.set_connection_timeout(std::chrono::milliseconds(timeoutMs));
    cli.set_read_timeout(std::chrono::milliseconds(timeoutMs));

    httplib::Headers requestHeaders;
    for (const auto& [name, value] : headers) {
        requestHeaders.emplace(name, value);
    }

    auto res = cli.Post(path, requestHeaders, body, "application/json");
    if (!res) {
        out.error = "Connection failed: " + std::to_string(static_cast<int>(res.error()));
        std::cerr << "[HttplibTransport] " << out.error << " (" << schemeHostPort << ")" << std::endl;
        return out;
    }

    out.status = res->status;
    out.body = res->body;
    return out;
}

} // namespace variantwalker::infrastructure
