#include "modalqc/mac.hpp"
#include <algorithm>

namespace modalqc {

double compute_mac(const Eigen::VectorXd& a, const Eigen::VectorXd& b) {
    if (a.size() != b.size()) {
        throw ShapeMismatchError(
            "Mode shape length mismatch: " + std::to_string(a.size()) +
            " vs " + std::to_string(b.size()));
    }
    double aa = a.squaredNorm();
    double bb = b.squaredNorm();
    double tol = DEGENERATE_NORM_TOL * std::max<double>(1.0, static_cast<double>(a.size()));
    if (!(aa > tol) || !(bb > tol)) {
        throw DegenerateShapeError("Mode shape has near-zero norm");
    }
    double ab = a.dot(b);
    double mac = (ab * ab) / (aa * bb);
    // Rounding can push collinear shapes marginally above 1
    return std::min(1.0, std::max(0.0, mac));
}

Eigen::MatrixXd mac_matrix(const Eigen::MatrixXd& A, const Eigen::MatrixXd& B) {
    if (A.rows() != B.rows()) {
        throw ShapeMismatchError("mac_matrix: shape sets have different channel counts");
    }
    Eigen::MatrixXd M(A.cols(), B.cols());
    for (int i = 0; i < A.cols(); i++) {
        for (int j = 0; j < B.cols(); j++) {
            M(i, j) = compute_mac(A.col(i), B.col(j));
        }
    }
    return M;
}

MacMatcher::MacMatcher(std::vector<ReferenceModeShape> references, double min_match_mac)
    : references_(std::move(references)), min_match_mac_(min_match_mac) {
    if (references_.empty()) {
        throw std::invalid_argument("MacMatcher requires at least one reference shape");
    }
    if (min_match_mac_ < 0.0 || min_match_mac_ > 1.0) {
        throw std::invalid_argument("min_match_mac must be in [0, 1]");
    }
}

MatchOutcome MacMatcher::match(const RawCandidate& candidate, int mode_number) const {
    MatchOutcome out;
    out.segment_id = candidate.segment_id;

    int best = -1;
    double best_mac = -1.0;
    try {
        for (int i = 0; i < static_cast<int>(references_.size()); i++) {
            double mac = compute_mac(candidate.mode_shape, references_[i].shape);
            // Strict comparison: ties keep the earlier reference
            if (mac > best_mac) {
                best_mac = mac;
                best = i;
            }
        }
    } catch (const ShapeMismatchError& e) {
        out.status = MatchOutcome::Status::REJECTED;
        out.reason = "ShapeMismatch";
        out.detail = e.what();
        return out;
    } catch (const DegenerateShapeError& e) {
        out.status = MatchOutcome::Status::REJECTED;
        out.reason = "DegenerateShape";
        out.detail = e.what();
        return out;
    }

    out.best_label = references_[best].label;
    out.best_mac = best_mac;

    if (best_mac < min_match_mac_) {
        out.status = MatchOutcome::Status::UNMATCHED;
        out.reason = "Unmatched";
        out.detail = "best MAC " + std::to_string(best_mac) + " against " +
                     out.best_label + " below " + std::to_string(min_match_mac_);
        return out;
    }

    out.status = MatchOutcome::Status::MATCHED;
    ModeObservation& obs = out.observation;
    obs.mode_number = mode_number;
    obs.segment_id = candidate.segment_id;
    obs.sub_mode_label = out.best_label;
    obs.frequency = candidate.frequency;
    obs.damping_ratio = candidate.damping_ratio;
    obs.mode_shape = candidate.mode_shape;
    obs.mac_value = best_mac;
    obs.detection_percentage = candidate.detection_percentage;
    return out;
}

std::vector<MatchOutcome> MacMatcher::match_all(
    const std::vector<RawCandidate>& candidates, int mode_number) const
{
    std::vector<MatchOutcome> outcomes;
    outcomes.reserve(candidates.size());
    for (const auto& c : candidates) {
        outcomes.push_back(match(c, mode_number));
    }
    return outcomes;
}

}  // namespace modalqc
