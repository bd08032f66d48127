#pragma once

#include <stdexcept>
#include <string>

namespace rlm::utils {

// Raised before a run starts when credentials or settings are unusable.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error(message) {}
};

// Raised at the LLM call boundary when the endpoint cannot produce a reply.
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& message)
        : std::runtime_error(message) {}
};

}  // namespace rlm::utils
