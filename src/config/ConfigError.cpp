#include "plugctl/config/ConfigError.hpp"

namespace plugctl::config {

const char* toString(ConfigErrorKind kind) {
    switch (kind) {
        case ConfigErrorKind::ParseError:  return "config parse error";
        case ConfigErrorKind::NotFound:    return "config not found";
        case ConfigErrorKind::UnknownHost: return "unknown host";
    }
    return "config error";
}

} // namespace plugctl::config
