#pragma once

#include "modalqc/observation.hpp"
#include "modalqc/reference_shapes.hpp"

namespace modalqc {

// Synthetic per-segment candidates for exercising the engine without an
// upstream identification run.
struct SyntheticConfig {
    int num_segments = 10;
    double base_frequency = 25.0;        // Hz, first sub-mode
    double sub_mode_spacing = 0.5;       // Hz between consecutive sub-modes
    double drift_per_segment = 0.0;      // Hz per segment (slow structural trend)
    double frequency_sigma = 0.02;       // Hz
    double damping_mean = 0.02;
    double damping_sigma = 0.005;
    double shape_noise_sigma = 0.05;     // per channel, on unit-norm references

    // Segments whose estimates are corrupted: frequency offset and
    // extra shape noise
    std::vector<int> anomaly_segments;
    double anomaly_frequency_offset = 5.0;
    double anomaly_shape_noise_sigma = 0.8;

    unsigned int seed = 42;
};

// One candidate per reference sub-mode per segment (segment ids 1..N),
// sub-modes in reference order. Reproducible for a given seed.
std::vector<RawCandidate> generate_synthetic_candidates(
    const SyntheticConfig& config,
    const std::vector<ReferenceModeShape>& references);

}  // namespace modalqc
