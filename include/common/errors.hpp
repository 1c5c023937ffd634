#pragma once

#include <stdexcept>
#include <string>

namespace tarb {

/**
 * A required external capability is not configured (e.g. API credentials
 * for live order placement). Fatal for the symbol loop that hits it.
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace tarb
