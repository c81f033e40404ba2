#include "modalqc/ensemble.hpp"
#include "modalqc/statistics.hpp"
#include <array>

namespace modalqc {

std::vector<EnsembleResult> combine(
    const std::vector<ModeObservation>& group,
    const std::vector<MethodResult>& method_results)
{
    int n = static_cast<int>(group.size());

    // Index votes by method kind so input order is irrelevant
    std::array<const MethodResult*, NUM_METHODS> by_kind{};
    for (const auto& mr : method_results) {
        if (!mr.ran) continue;
        if (static_cast<int>(mr.flags.size()) != n) {
            throw std::invalid_argument(
                "combine: " + method_name(mr.method) + " returned " +
                std::to_string(mr.flags.size()) + " flags for " +
                std::to_string(n) + " observations");
        }
        int k = static_cast<int>(mr.method);
        if (by_kind[k] != nullptr) {
            throw std::invalid_argument(
                "combine: duplicate result for " + method_name(mr.method));
        }
        by_kind[k] = &mr;
    }

    Eigen::VectorXd freq(n);
    for (int i = 0; i < n; i++) freq(i) = group[i].frequency;
    double mu = sample_mean(freq);
    double sigma = sample_std(freq);

    std::vector<EnsembleResult> out(n);
    for (int i = 0; i < n; i++) {
        EnsembleResult& e = out[i];
        e.segment_id = group[i].segment_id;
        e.sub_mode_label = group[i].sub_mode_label;
        e.distance_from_mean =
            negligible_spread(sigma, mu) ? 0.0 : (group[i].frequency - mu) / sigma;

        MethodKind last = MethodKind::DeviationScore;
        for (int k = 0; k < NUM_METHODS; k++) {
            if (by_kind[k] && by_kind[k]->flags[i].is_outlier) {
                e.votes++;
                last = static_cast<MethodKind>(k);
            }
        }

        e.is_outlier = e.votes > 0;
        if (e.votes == 0) {
            e.outlier_type = OutlierType::None;
        } else if (e.votes == 1) {
            e.outlier_type = outlier_type_for(last);
        } else {
            e.outlier_type = OutlierType::Combined;
        }
    }
    return out;
}

}  // namespace modalqc
