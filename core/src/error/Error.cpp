#include "allpair/core/error/Error.h"

namespace allpair::core {

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:
            return "none";
        case ErrorKind::Configuration:
            return "configuration";
        case ErrorKind::ScheduleGeneration:
            return "schedule_generation";
        case ErrorKind::JobLaunch:
            return "job_launch";
        case ErrorKind::JobTimeout:
            return "job_timeout";
        case ErrorKind::JobFailure:
            return "job_failure";
    }
    return "unknown";
}

bool Fail(Error* error, ErrorKind kind, const std::string& message) {
    if (error) {
        error->kind = kind;
        error->message = message;
    }
    return false;
}

}  // namespace allpair::core
