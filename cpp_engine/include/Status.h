#pragma once

#include <string>
#include <utility>

namespace rescue {

// Error taxonomy. Only ConfigurationError is allowed to abort a run; everything
// else is contained at the agent or mission level and becomes outcome data.
enum class ErrorCode : int {
    Ok = 0,
    ConfigurationError = 1,
    NoPathFound = 2,
    PersistenceUnavailable = 3,
    HazardHintRejected = 4,
};

struct Status {
    ErrorCode code = ErrorCode::Ok;
    std::string message;

    bool ok() const noexcept { return code == ErrorCode::Ok; }

    static Status success() { return Status{}; }
    static Status error(ErrorCode c, std::string msg) {
        Status s;
        s.code = c;
        s.message = std::move(msg);
        return s;
    }
};

inline const char* errorCodeName(ErrorCode c) {
    switch (c) {
        case ErrorCode::Ok:                     return "ok";
        case ErrorCode::ConfigurationError:     return "configuration_error";
        case ErrorCode::NoPathFound:            return "no_path_found";
        case ErrorCode::PersistenceUnavailable: return "persistence_unavailable";
        case ErrorCode::HazardHintRejected:     return "hazard_hint_rejected";
    }
    return "unknown";
}

} // namespace rescue
