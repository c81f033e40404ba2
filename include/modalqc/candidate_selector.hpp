#pragma once

#include "modalqc/observation.hpp"
#include <map>

namespace modalqc {

struct SelectionResult {
    std::vector<ModeObservation> observations;   // survivors, input order
    std::map<int, int> removed_per_segment;      // only segments that lost candidates
    std::map<std::string, int> winner_counts;    // label -> segments won
    int total_removed = 0;
};

// Keep only the highest-MAC observation of each segment. Ties keep the
// candidate that appears first. Observation values are never modified.
SelectionResult select_best_candidates(const std::vector<ModeObservation>& observations);

}  // namespace modalqc
