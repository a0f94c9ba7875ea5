#ifndef DAMASCUS_COMMON_ERROR_HPP
#define DAMASCUS_COMMON_ERROR_HPP

#include <stdexcept>
#include <string>

namespace damascus {

// Relative tolerance for volume conservation and the layer-height invariant
constexpr double kVolumeTolerance = 1e-3;

enum class ErrorCode {
    // Validation: rejected before any state is computed
    InvalidParameter,
    PreconditionFailed,

    // Numerical: the candidate state was computed but failed validation
    NonFiniteGeometry,
    DegenerateGeometry,
    VolumeNotConserved,
    HeightMismatch,

    // Export
    IoFailure
};

const char* to_string(ErrorCode code);

bool is_validation_error(ErrorCode code);
bool is_numerical_error(ErrorCode code);

// Every failure the engine reports. A throw always leaves the Billet exactly
// as it was before the call.
class Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& message);

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

}  // namespace damascus

#endif // DAMASCUS_COMMON_ERROR_HPP
