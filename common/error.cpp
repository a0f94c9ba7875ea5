#include "error.hpp"

namespace damascus {

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidParameter: return "invalid_parameter";
        case ErrorCode::PreconditionFailed: return "precondition_failed";
        case ErrorCode::NonFiniteGeometry: return "non_finite_geometry";
        case ErrorCode::DegenerateGeometry: return "degenerate_geometry";
        case ErrorCode::VolumeNotConserved: return "volume_not_conserved";
        case ErrorCode::HeightMismatch: return "height_mismatch";
        case ErrorCode::IoFailure: return "io_failure";
    }
    return "unknown";
}

bool is_validation_error(ErrorCode code) {
    return code == ErrorCode::InvalidParameter || code == ErrorCode::PreconditionFailed;
}

bool is_numerical_error(ErrorCode code) {
    return code == ErrorCode::NonFiniteGeometry || code == ErrorCode::DegenerateGeometry ||
           code == ErrorCode::VolumeNotConserved || code == ErrorCode::HeightMismatch;
}

Error::Error(ErrorCode code, const std::string& message)
    : std::runtime_error(std::string(to_string(code)) + ": " + message), code_(code) {}

}  // namespace damascus
