#include "errors.hpp"

namespace gitsight {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::NotFound:
        return "not-found";
    case ErrorKind::UnrelatedHistory:
        return "unrelated-history";
    case ErrorKind::MalformedState:
        return "malformed-state";
    case ErrorKind::NegotiationRejected:
        return "negotiation-rejected";
    case ErrorKind::Git:
        break;
    }
    return "git";
}

int exit_code_for(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::NotFound:
        return 2;
    case ErrorKind::UnrelatedHistory:
        return 3;
    case ErrorKind::MalformedState:
        return 4;
    case ErrorKind::NegotiationRejected:
        return 5;
    case ErrorKind::Git:
        break;
    }
    return 1;
}

} // namespace gitsight
