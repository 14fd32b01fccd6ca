#pragma once

#include <stdexcept>
#include <string>

namespace wsp {

// Invalid or missing required input. Raised before any network activity.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace wsp
