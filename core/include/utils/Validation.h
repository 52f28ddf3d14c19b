#ifndef VALIDATION_H
#define VALIDATION_H

#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

// Raised eagerly when a model or network configuration cannot be run.
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& what)
        : std::invalid_argument(what) {}
};

namespace validation {

inline void require(bool condition, const std::string& message) {
    if (!condition) {
        throw ConfigurationError(message);
    }
}

inline void checkUnitInterval(double value, const char* name) {
    if (!(value >= 0.0 && value <= 1.0)) {
        throw ConfigurationError(std::string(name) + " must be in [0, 1] (got " +
                                 std::to_string(value) + ")");
    }
}

inline void checkIndex(std::size_t index, std::size_t size, const char* where) {
    if (index >= size) {
        throw std::out_of_range(std::string("index ") + std::to_string(index) +
                                " out of range (size " + std::to_string(size) +
                                ") in " + where);
    }
}

// Non-negative integer option text, digits only (no sign), at most `maxValue`.
inline std::uint64_t parseCount(const std::string& text, const char* name,
                                std::uint64_t maxValue = std::numeric_limits<std::uint64_t>::max()) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw ConfigurationError(std::string(name) + " must be a non-negative integer (got '" +
                                 text + "')");
    }
    std::uint64_t value = 0;
    for (char c : text) {
        const std::uint64_t digit = static_cast<std::uint64_t>(c - '0');
        if (value > (maxValue - digit) / 10) {
            throw ConfigurationError(std::string(name) + " is too large (got " + text + ")");
        }
        value = value * 10 + digit;
    }
    return value;
}

}  // namespace validation

#endif
