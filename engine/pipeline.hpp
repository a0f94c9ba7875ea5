#ifndef DAMASCUS_ENGINE_PIPELINE_HPP
#define DAMASCUS_ENGINE_PIPELINE_HPP

#include <billet/billet.hpp>
#include <billet/frame.hpp>
#include <billet/operation.hpp>
#include <billet/operation_record.hpp>
#include <vector>

namespace damascus {

// Apply one operation to a frame in place. `report` is null while replaying
// history and non-null for the operation being committed.
void apply_stage(BilletFrame& frame, const Operation& op, StageReport* report);

// Recompute the current state from the creation-time snapshots and the
// recorded parameter history. Never reads the committed vertices.
BilletFrame replay(const Billet& billet);

// Same as replay() with one more operation appended
BilletFrame replay_with(const Billet& billet, const Operation& op);

DisplacementStats displacement_between(const Vertices& before, const Vertices& after);

// Runs an operation as a transaction: replay, apply, validate, commit.
// Any failure throws damascus::Error and leaves the billet untouched.
class OperationRunner {
public:
    static OperationStats run(Billet& billet, const Operation& op);

private:
    // Finite coordinates, non-degenerate triangles, layer heights summing to
    // the billet height, and volume conservation where the operation requires it
    static void validate(const Billet& billet, const BilletFrame& before,
                         const BilletFrame& candidate, const Operation& op);
};

}  // namespace damascus

#endif // DAMASCUS_ENGINE_PIPELINE_HPP
