#pragma once

#include "modalqc/observation.hpp"
#include <map>

namespace modalqc {

// Flat per-observation record handed to the reporting layer
struct ReportRecord {
    int mode_number = 0;
    int segment_id = 0;
    std::string sub_mode_label;
    double frequency = 0.0;
    double damping_ratio = 0.0;
    double mac_value = 0.0;
    double detection_percentage = 0.0;

    // Per-method metrics, NaN when the method did not run
    double z_score = NaN;
    double trend_deviation = NaN;
    double mahalanobis_distance = NaN;

    bool deviation_flag = false;
    bool trend_flag = false;
    bool joint_flag = false;
    bool joint_fallback = false;

    bool is_outlier = false;
    OutlierType outlier_type = OutlierType::None;
    int votes = 0;
    double distance_from_mean = 0.0;
};

// Candidate that never reached the outlier methods
struct ExcludedCandidate {
    int segment_id = 0;
    std::string reason;    // Unmatched, ShapeMismatch, DegenerateShape
    std::string detail;
};

struct MethodStatus {
    MethodKind method = MethodKind::DeviationScore;
    bool ran = false;
    std::string failure_reason;
    bool used_fallback = false;
    int num_flagged = 0;
};

struct SelectorStats {
    bool enabled = false;
    int total_removed = 0;
    std::map<int, int> removed_per_segment;
    std::map<std::string, int> winner_counts;
};

struct SubModeStatistics {
    std::string label;
    int count = 0;
    double mean_frequency = 0.0;
    double std_frequency = 0.0;
    double mean_damping = 0.0;
    double std_damping = 0.0;
    double mean_mac = 0.0;
    int outlier_count = 0;
};

struct RunSummary {
    int mode_number = 0;
    int num_candidates = 0;
    int num_matched = 0;       // labelled by the MAC matcher
    int num_unmatched = 0;
    int num_rejected = 0;      // shape errors
    int num_analysed = 0;      // observations that reached the outlier methods
    int num_outliers = 0;

    std::vector<ExcludedCandidate> excluded;
    std::vector<MethodStatus> methods;
    SelectorStats selector;
    std::vector<SubModeStatistics> sub_modes;
    std::vector<std::string> warnings;
    std::string error;         // set when the whole mode analysis failed
};

// One record per observation, ordered by (segment_id, sub_mode_label).
// ensemble must be parallel to group.
std::vector<ReportRecord> assemble_report(
    const std::vector<ModeObservation>& group,
    const std::vector<MethodResult>& method_results,
    const std::vector<EnsembleResult>& ensemble);

// Statistics per sub-mode label, sorted by label
std::vector<SubModeStatistics> compute_sub_mode_statistics(
    const std::vector<ReportRecord>& records);

// Tabular export: Segment, Sub_Mode, Frequency, MAC_Value, Z_Score,
// Is_Outlier, Outlier_Type, Distance_from_Mean, then Mode and the traceability
// columns. Sub-mode labels containing commas or quotes are quoted.
void export_report_csv(const std::string& filename,
                       const std::vector<ReportRecord>& records);

void export_summary_csv(const std::string& filename,
                        const std::vector<RunSummary>& summaries);

// Human-readable multi-line summary
std::string format_summary(const RunSummary& summary);

}  // namespace modalqc
