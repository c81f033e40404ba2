#pragma once

#include "modalqc/common.hpp"
#include <map>

namespace modalqc {

struct ReferenceModeShape {
    int mode_number = 0;
    std::string label;          // sub-mode label, e.g. "6.1"
    Eigen::VectorXd shape;      // unit norm
};

// Canonical reference shapes per mode number. Filled once from the
// configuration and read-only afterwards.
class ReferenceShapeStore {
public:
    // Add a reference for mode_number. The shape is normalised to unit length.
    // Throws DegenerateShapeError for a zero shape, ShapeMismatchError when the
    // channel count disagrees with references already stored for the mode,
    // std::invalid_argument for a duplicate label or non-positive mode number.
    void add(int mode_number, const std::string& label, const Eigen::VectorXd& shape);

    // References of one mode in insertion order (empty if unknown)
    const std::vector<ReferenceModeShape>& for_mode(int mode_number) const;

    bool has_mode(int mode_number) const;
    std::vector<int> mode_numbers() const;
    int channel_count(int mode_number) const;
    int size() const;

    // Auto-MAC between the references of one mode (n_ref x n_ref)
    Eigen::MatrixXd cross_mac(int mode_number) const;

    // Label pairs of one mode whose references have MAC above threshold
    std::vector<std::pair<std::string, std::string>> ambiguous_pairs(
        int mode_number, double threshold = 0.9) const;

private:
    std::map<int, std::vector<ReferenceModeShape>> shapes_;
};

}  // namespace modalqc
