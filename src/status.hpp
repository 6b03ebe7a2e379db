#pragma once
#include <string>

namespace substrate {

// Modules report one error kind for bad configuration. Validation never
// throws and never mutates state on failure.
enum class ErrorKind { None, InvalidConfiguration };

struct Status {
    ErrorKind kind = ErrorKind::None;
    std::string message;

    bool ok() const { return kind == ErrorKind::None; }

    static Status success() { return {}; }
    static Status invalid_configuration(const std::string& msg) {
        return Status{ErrorKind::InvalidConfiguration, msg};
    }
};

} // namespace substrate
