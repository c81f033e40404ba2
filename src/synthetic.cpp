#include "modalqc/synthetic.hpp"
#include <algorithm>
#include <random>

namespace modalqc {

std::vector<RawCandidate> generate_synthetic_candidates(
    const SyntheticConfig& config,
    const std::vector<ReferenceModeShape>& references)
{
    if (config.num_segments < 0) {
        throw std::invalid_argument("num_segments must be non-negative");
    }
    if (references.empty()) {
        throw std::invalid_argument("Synthetic candidates need at least one reference shape");
    }

    std::mt19937 gen(config.seed);
    std::normal_distribution<double> unit(0.0, 1.0);
    std::uniform_real_distribution<double> detection(0.6, 1.0);

    std::vector<RawCandidate> candidates;
    candidates.reserve(static_cast<size_t>(config.num_segments) * references.size());

    for (int seg = 1; seg <= config.num_segments; seg++) {
        bool anomalous = std::find(config.anomaly_segments.begin(),
                                   config.anomaly_segments.end(), seg)
                         != config.anomaly_segments.end();

        for (size_t r = 0; r < references.size(); r++) {
            const Eigen::VectorXd& ref = references[r].shape;

            RawCandidate c;
            c.segment_id = seg;
            c.frequency = config.base_frequency
                        + config.sub_mode_spacing * static_cast<double>(r)
                        + config.drift_per_segment * seg
                        + config.frequency_sigma * unit(gen);
            double zeta = config.damping_mean + config.damping_sigma * unit(gen);
            c.damping_ratio = std::min(std::max(zeta, 0.0), 0.999);
            c.detection_percentage = detection(gen);

            double noise = config.shape_noise_sigma;
            if (anomalous) {
                c.frequency += config.anomaly_frequency_offset;
                noise += config.anomaly_shape_noise_sigma;
            }
            c.mode_shape.resize(ref.size());
            for (int k = 0; k < ref.size(); k++) {
                c.mode_shape(k) = ref(k) + noise * unit(gen);
            }
            candidates.push_back(std::move(c));
        }
    }
    return candidates;
}

}  // namespace modalqc
