#include "modalqc/candidate_selector.hpp"

namespace modalqc {

SelectionResult select_best_candidates(const std::vector<ModeObservation>& observations) {
    SelectionResult result;

    // segment -> index of current best, and candidate count per segment
    std::map<int, size_t> best_index;
    std::map<int, int> count;
    for (size_t i = 0; i < observations.size(); i++) {
        int seg = observations[i].segment_id;
        count[seg]++;
        auto it = best_index.find(seg);
        if (it == best_index.end()) {
            best_index[seg] = i;
        } else if (observations[i].mac_value > observations[it->second].mac_value) {
            it->second = i;
        }
    }

    for (size_t i = 0; i < observations.size(); i++) {
        if (best_index[observations[i].segment_id] == i) {
            result.observations.push_back(observations[i]);
            result.winner_counts[observations[i].sub_mode_label]++;
        }
    }

    for (const auto& kv : count) {
        if (kv.second > 1) {
            result.removed_per_segment[kv.first] = kv.second - 1;
            result.total_removed += kv.second - 1;
        }
    }

    return result;
}

}  // namespace modalqc
