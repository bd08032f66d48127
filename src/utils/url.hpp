#pragma once

#include <string>

namespace rlm::utils {

struct ParsedUrl {
    bool https = true;
    std::string host;
    int port = 443;
    std::string base_path;

    // "scheme://host:port", the form httplib::Client accepts.
    std::string Origin() const;
};

ParsedUrl ParseUrl(const std::string& url);
bool ParseProxyHostPort(const std::string& proxy, std::string& host, int& port);
// Percent-encodes every byte of a relative path except unreserved
// characters and the '/' separators.
std::string EncodePath(const std::string& path);

}  // namespace rlm::utils
