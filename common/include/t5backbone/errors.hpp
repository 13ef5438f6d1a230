#ifndef T5BACKBONE_ERRORS_HPP
#define T5BACKBONE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace t5backbone {

// Invalid hyperparameters or an unreadable configuration file.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error("ConfigError: " + message) {}
};

class PresetNotFoundError : public std::runtime_error {
public:
    explicit PresetNotFoundError(const std::string& message)
        : std::runtime_error("PresetNotFoundError: " + message) {}
};

}

#endif
