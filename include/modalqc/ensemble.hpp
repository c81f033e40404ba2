#pragma once

#include "modalqc/observation.hpp"

namespace modalqc {

// Merge per-method votes into one verdict per observation.
//
// Only methods with ran == true vote. The outlier type is None for zero
// votes, the method's own type for one vote and Combined for two or more.
// distance_from_mean is the frequency z-score over the whole group (0 when
// the spread is zero) and is reported regardless of which methods ran.
// The result does not depend on the order of method_results.
std::vector<EnsembleResult> combine(
    const std::vector<ModeObservation>& group,
    const std::vector<MethodResult>& method_results);

}  // namespace modalqc
