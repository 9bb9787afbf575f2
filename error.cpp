#include "error.h"

namespace qb::apidoc {

Error Error::inferred_response_conflict(uint16_t status) {
    return Error(ErrorKind::InferredResponseConflict,
                 "inferred response conflict for status " + std::to_string(status), status);
}

Error Error::inferred_default_response_conflict() {
    return Error(ErrorKind::InferredDefaultResponseConflict, "inferred default response conflict");
}

Error Error::duplicate_parameter(const std::string &name, const std::string &in) {
    return Error(ErrorKind::DuplicateParameter,
                 "duplicate parameter '" + name + "' in " + in);
}

Error Error::duplicate_request_body() {
    return Error(ErrorKind::DuplicateRequestBody, "duplicate request body");
}

Error Error::other(std::string message) {
    return Error(ErrorKind::Other, std::move(message));
}

const char *error_kind_name(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::InferredResponseConflict:        return "InferredResponseConflict";
        case ErrorKind::InferredDefaultResponseConflict: return "InferredDefaultResponseConflict";
        case ErrorKind::DuplicateParameter:              return "DuplicateParameter";
        case ErrorKind::DuplicateRequestBody:            return "DuplicateRequestBody";
        case ErrorKind::Other:                           return "Other";
    }
    return "Unknown";
}

std::ostream &operator<<(std::ostream &os, const Error &error) {
    return os << error_kind_name(error.kind) << ": " << error.message;
}

} // namespace qb::apidoc
