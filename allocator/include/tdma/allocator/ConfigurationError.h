#pragma once

#include <stdexcept>
#include <string>

namespace tdma::allocator {

// Raised before any round runs when the run cannot be set up.
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& what) : std::invalid_argument(what) {}
};

}  // namespace tdma::allocator
