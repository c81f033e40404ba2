#include "modalqc/reference_shapes.hpp"
#include "modalqc/mac.hpp"

namespace modalqc {

void ReferenceShapeStore::add(int mode_number, const std::string& label,
                              const Eigen::VectorXd& shape) {
    if (mode_number <= 0) {
        throw std::invalid_argument("Mode number must be positive");
    }
    if (shape.size() == 0) {
        throw DegenerateShapeError("Reference shape '" + label + "' is empty");
    }
    double norm2 = shape.squaredNorm();
    if (!std::isfinite(norm2) ||
        norm2 <= DEGENERATE_NORM_TOL * static_cast<double>(shape.size())) {
        throw DegenerateShapeError("Reference shape '" + label + "' has zero norm");
    }

    auto& refs = shapes_[mode_number];
    if (!refs.empty() && refs.front().shape.size() != shape.size()) {
        throw ShapeMismatchError(
            "Reference shape '" + label + "' has " + std::to_string(shape.size()) +
            " channels, mode " + std::to_string(mode_number) + " uses " +
            std::to_string(refs.front().shape.size()));
    }
    for (const auto& r : refs) {
        if (r.label == label) {
            throw std::invalid_argument("Duplicate reference label: " + label);
        }
    }

    ReferenceModeShape ref;
    ref.mode_number = mode_number;
    ref.label = label;
    ref.shape = shape / std::sqrt(norm2);
    refs.push_back(std::move(ref));
}

const std::vector<ReferenceModeShape>& ReferenceShapeStore::for_mode(int mode_number) const {
    static const std::vector<ReferenceModeShape> empty;
    auto it = shapes_.find(mode_number);
    return (it != shapes_.end()) ? it->second : empty;
}

bool ReferenceShapeStore::has_mode(int mode_number) const {
    auto it = shapes_.find(mode_number);
    return it != shapes_.end() && !it->second.empty();
}

std::vector<int> ReferenceShapeStore::mode_numbers() const {
    std::vector<int> modes;
    modes.reserve(shapes_.size());
    for (const auto& kv : shapes_) {
        if (!kv.second.empty()) modes.push_back(kv.first);
    }
    return modes;
}

int ReferenceShapeStore::channel_count(int mode_number) const {
    const auto& refs = for_mode(mode_number);
    return refs.empty() ? 0 : static_cast<int>(refs.front().shape.size());
}

int ReferenceShapeStore::size() const {
    int n = 0;
    for (const auto& kv : shapes_) n += static_cast<int>(kv.second.size());
    return n;
}

Eigen::MatrixXd ReferenceShapeStore::cross_mac(int mode_number) const {
    const auto& refs = for_mode(mode_number);
    int n_ref = static_cast<int>(refs.size());
    if (n_ref == 0) return Eigen::MatrixXd();

    Eigen::MatrixXd Phi(refs.front().shape.size(), n_ref);
    for (int i = 0; i < n_ref; i++) {
        Phi.col(i) = refs[i].shape;
    }
    return mac_matrix(Phi, Phi);
}

std::vector<std::pair<std::string, std::string>> ReferenceShapeStore::ambiguous_pairs(
    int mode_number, double threshold) const
{
    std::vector<std::pair<std::string, std::string>> pairs;
    const auto& refs = for_mode(mode_number);
    Eigen::MatrixXd M = cross_mac(mode_number);
    for (int i = 0; i < M.rows(); i++) {
        for (int j = i + 1; j < M.cols(); j++) {
            if (M(i, j) > threshold) {
                pairs.emplace_back(refs[i].label, refs[j].label);
            }
        }
    }
    return pairs;
}

}  // namespace modalqc
