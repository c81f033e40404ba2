#pragma once

#include "modalqc/common.hpp"
#include "modalqc/observation.hpp"
#include "modalqc/reference_shapes.hpp"

namespace modalqc {

// Modal Assurance Criterion:
//   MAC(a, b) = |a^T b|^2 / ((a^T a)(b^T b))
// 1 for collinear shapes (any scale or sign), 0 for orthogonal shapes.
// Throws ShapeMismatchError on length mismatch, DegenerateShapeError when
// either shape has near-zero norm.
double compute_mac(const Eigen::VectorXd& a, const Eigen::VectorXd& b);

// Pairwise MAC between the columns of A and the columns of B
Eigen::MatrixXd mac_matrix(const Eigen::MatrixXd& A, const Eigen::MatrixXd& B);

struct MatchOutcome {
    enum class Status { MATCHED, UNMATCHED, REJECTED };
    Status status = Status::UNMATCHED;
    int segment_id = 0;

    ModeObservation observation;   // valid when MATCHED
    std::string best_label;        // best reference even when UNMATCHED
    double best_mac = 0.0;
    std::string reason;            // "ShapeMismatch" / "DegenerateShape" when REJECTED
    std::string detail;
};

class MacMatcher {
public:
    // references: the sub-mode references of one mode number
    // min_match_mac: candidates whose best MAC is below this stay unlabelled
    MacMatcher(std::vector<ReferenceModeShape> references, double min_match_mac);

    // Label one candidate with its best-matching sub-mode.
    // Never throws for a bad candidate; errors become REJECTED outcomes.
    MatchOutcome match(const RawCandidate& candidate, int mode_number) const;

    std::vector<MatchOutcome> match_all(
        const std::vector<RawCandidate>& candidates, int mode_number) const;

private:
    std::vector<ReferenceModeShape> references_;
    double min_match_mac_;
};

}  // namespace modalqc
