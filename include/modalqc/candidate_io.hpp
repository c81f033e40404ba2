#pragma once

#include "modalqc/observation.hpp"
#include <map>

namespace modalqc {

// Candidate table, one row per candidate:
//   mode,segment,frequency,damping_ratio,detection_percentage,phi_1,...,phi_n
// The header row is required; the number of phi columns fixes the channel count.
// Throws std::runtime_error with the line number for malformed rows.
std::map<int, std::vector<RawCandidate>> load_candidates_csv(const std::string& filename);

void export_candidates_csv(const std::string& filename,
                           const std::map<int, std::vector<RawCandidate>>& candidates_by_mode);

}  // namespace modalqc
