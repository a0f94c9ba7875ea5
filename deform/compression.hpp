#ifndef DAMASCUS_DEFORM_COMPRESSION_HPP
#define DAMASCUS_DEFORM_COMPRESSION_HPP

#include <billet/billet.hpp>
#include <billet/frame.hpp>
#include <billet/operation.hpp>
#include <billet/operation_record.hpp>

namespace damascus {

// Lateral growth that keeps volume constant for a height factor f: 1 / sqrt(f)
double compression_spread(double compression_factor);

// Throws Error(InvalidParameter) unless 0 < factor <= 1
void validate(const CompressionParams& params, const BilletFrame& frame);

// Scales heights by the factor and spreads width and length to match.
// Applied to the state left by the preceding operations, so repeated
// compressions multiply.
void transform_frame(BilletFrame& frame, const CompressionParams& params, StageReport* report);

OperationStats apply_compression(Billet& billet, const CompressionParams& params);

}  // namespace damascus

#endif // DAMASCUS_DEFORM_COMPRESSION_HPP
