#pragma once

#include "modalqc/common.hpp"
#include "modalqc/observation.hpp"
#include "modalqc/reference_shapes.hpp"
#include "modalqc/outlier_methods.hpp"
#include "modalqc/report.hpp"
#include <map>

namespace modalqc {

// Per mode-number analysis settings
struct ModeConfig {
    double min_match_mac = 0.2;     // below this a candidate stays unlabelled
    bool best_mac_only = false;     // keep one candidate per segment

    DeviationScoreConfig deviation_score;
    TrendFitConfig trend_fit;
    JointDistanceConfig joint_distance;
};

struct EngineConfig {
    ReferenceShapeStore references;
    std::map<int, ModeConfig> modes;    // modes without an entry use ModeConfig()

    int max_threads = 0;                // mode-level workers (0 = hardware concurrency)
    bool parallel_methods = false;      // run the three methods on separate threads
    bool verbose = true;                // log degraded conditions to stderr

    // Settings for one mode (defaults when not configured)
    ModeConfig mode_config(int mode_number) const;

    // Throws std::invalid_argument describing the first invalid setting
    void validate() const;
};

struct ModeAnalysis {
    int mode_number = 0;
    std::vector<ReportRecord> records;
    RunSummary summary;
};

class OutlierEngine {
public:
    explicit OutlierEngine(EngineConfig config);

    // Match, optionally deduplicate, screen and combine one mode's candidates.
    // Per-candidate and per-method problems are recorded in the summary;
    // only an unknown mode number throws (std::invalid_argument).
    ModeAnalysis analyze_mode(int mode_number,
                              const std::vector<RawCandidate>& candidates) const;

    // Independent analyses on a worker pool. A failing mode yields a
    // summary with error set; results are ordered by mode number.
    std::vector<ModeAnalysis> analyze_modes(
        const std::map<int, std::vector<RawCandidate>>& candidates_by_mode) const;

    // The detection methods configured for a mode, in canonical order
    std::vector<DetectionMethod> build_methods(int mode_number) const;

    const EngineConfig& config() const { return config_; }

private:
    EngineConfig config_;

    std::vector<MethodResult> run_methods(
        const std::vector<DetectionMethod>& methods,
        const std::vector<ModeObservation>& group) const;

    void log(int mode_number, const std::string& message) const;
};

}  // namespace modalqc
