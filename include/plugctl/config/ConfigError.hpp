#pragma once

#include <string>

namespace plugctl::config {

enum class ConfigErrorKind {
    ParseError,   ///< device table exists but is not valid
    NotFound,     ///< device table missing or unreadable
    UnknownHost   ///< credentials incomplete and host absent from the table
};

struct ConfigError {
    ConfigErrorKind kind = ConfigErrorKind::ParseError;
    std::string subject;  ///< table path, or the host for UnknownHost
    std::string message;
};

const char* toString(ConfigErrorKind kind);

} // namespace plugctl::config
