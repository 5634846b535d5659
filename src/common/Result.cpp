#include "linkgate/common/Result.h"

namespace linkgate {
namespace common {

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kInvalidLink: return "InvalidLink";
        case ErrorKind::kUnauthorized: return "Unauthorized";
        case ErrorKind::kObjectNotFound: return "ObjectNotFound";
        case ErrorKind::kMalformedRange: return "MalformedRange";
        case ErrorKind::kNoSessionsAvailable: return "NoSessionsAvailable";
        case ErrorKind::kBackendUnreachable: return "BackendUnreachable";
        case ErrorKind::kBackendTimeout: return "BackendTimeout";
        case ErrorKind::kBackendError: return "BackendError";
    }
    return "Unknown";
}

} // namespace common
} // namespace linkgate
