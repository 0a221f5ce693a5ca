#pragma once

#include <string>

namespace allpair::core {

enum class ErrorKind {
    None,
    Configuration,
    ScheduleGeneration,
    JobLaunch,
    JobTimeout,
    JobFailure
};

struct Error {
    ErrorKind kind = ErrorKind::None;
    std::string message;

    bool ok() const { return kind == ErrorKind::None; }
};

const char* ErrorKindName(ErrorKind kind);

// Fills *error when non-null and returns false so callers can `return Fail(...)`.
bool Fail(Error* error, ErrorKind kind, const std::string& message);

}  // namespace allpair::core
