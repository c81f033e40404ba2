#include "modalqc/report.hpp"
#include "modalqc/statistics.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace modalqc {

std::vector<ReportRecord> assemble_report(
    const std::vector<ModeObservation>& group,
    const std::vector<MethodResult>& method_results,
    const std::vector<EnsembleResult>& ensemble)
{
    int n = static_cast<int>(group.size());
    if (static_cast<int>(ensemble.size()) != n) {
        throw std::invalid_argument("assemble_report: ensemble size does not match group");
    }

    std::vector<ReportRecord> records(n);
    for (int i = 0; i < n; i++) {
        const ModeObservation& obs = group[i];
        ReportRecord& r = records[i];
        r.mode_number = obs.mode_number;
        r.segment_id = obs.segment_id;
        r.sub_mode_label = obs.sub_mode_label;
        r.frequency = obs.frequency;
        r.damping_ratio = obs.damping_ratio;
        r.mac_value = obs.mac_value;
        r.detection_percentage = obs.detection_percentage;

        r.is_outlier = ensemble[i].is_outlier;
        r.outlier_type = ensemble[i].outlier_type;
        r.votes = ensemble[i].votes;
        r.distance_from_mean = ensemble[i].distance_from_mean;
    }

    for (const auto& mr : method_results) {
        if (!mr.ran || static_cast<int>(mr.flags.size()) != n) continue;
        for (int i = 0; i < n; i++) {
            const MethodFlag& f = mr.flags[i];
            switch (mr.method) {
                case MethodKind::DeviationScore:
                    records[i].z_score = f.metric_value;
                    records[i].deviation_flag = f.is_outlier;
                    break;
                case MethodKind::TrendFit:
                    records[i].trend_deviation = f.metric_value;
                    records[i].trend_flag = f.is_outlier;
                    break;
                case MethodKind::JointDistance:
                    records[i].mahalanobis_distance = f.metric_value;
                    records[i].joint_flag = f.is_outlier;
                    records[i].joint_fallback = mr.used_fallback;
                    break;
            }
        }
    }

    std::stable_sort(records.begin(), records.end(),
                     [](const ReportRecord& a, const ReportRecord& b) {
        if (a.segment_id != b.segment_id) return a.segment_id < b.segment_id;
        return a.sub_mode_label < b.sub_mode_label;
    });
    return records;
}

std::vector<SubModeStatistics> compute_sub_mode_statistics(
    const std::vector<ReportRecord>& records)
{
    std::map<std::string, std::vector<const ReportRecord*>> by_label;
    for (const auto& r : records) {
        by_label[r.sub_mode_label].push_back(&r);
    }

    std::vector<SubModeStatistics> stats;
    stats.reserve(by_label.size());
    for (const auto& kv : by_label) {
        int n = static_cast<int>(kv.second.size());
        Eigen::VectorXd f(n), z(n), mac(n);
        SubModeStatistics s;
        s.label = kv.first;
        s.count = n;
        for (int i = 0; i < n; i++) {
            f(i) = kv.second[i]->frequency;
            z(i) = kv.second[i]->damping_ratio;
            mac(i) = kv.second[i]->mac_value;
            if (kv.second[i]->is_outlier) s.outlier_count++;
        }
        s.mean_frequency = sample_mean(f);
        s.std_frequency = sample_std(f);
        s.mean_damping = sample_mean(z);
        s.std_damping = sample_std(z);
        s.mean_mac = sample_mean(mac);
        stats.push_back(s);
    }
    return stats;
}

static std::string csv_number(double v) {
    if (std::isnan(v)) return "";
    std::ostringstream oss;
    oss << std::setprecision(10) << v;
    return oss.str();
}

// RFC 4180 quoting for free-text fields
static std::string csv_field(const std::string& v) {
    if (v.find_first_of(",\"\r\n") == std::string::npos) return v;
    std::string out = "\"";
    for (char c : v) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

void export_report_csv(const std::string& filename,
                       const std::vector<ReportRecord>& records) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file for writing: " + filename);
    }
    file << "Segment,Sub_Mode,Frequency,MAC_Value,Z_Score,Is_Outlier,Outlier_Type,"
            "Distance_from_Mean,Mode,Damping_Ratio,Detection_Percentage,Trend_Deviation,"
            "Mahalanobis_Distance,Joint_Fallback,Votes\n";

    for (const auto& r : records) {
        file << r.segment_id << ","
             << csv_field(r.sub_mode_label) << ","
             << csv_number(r.frequency) << ","
             << csv_number(r.mac_value) << ","
             << csv_number(r.z_score) << ","
             << (r.is_outlier ? "True" : "False") << ","
             << outlier_type_name(r.outlier_type) << ","
             << csv_number(r.distance_from_mean) << ","
             << r.mode_number << ","
             << csv_number(r.damping_ratio) << ","
             << csv_number(r.detection_percentage) << ","
             << csv_number(r.trend_deviation) << ","
             << csv_number(r.mahalanobis_distance) << ","
             << (r.joint_fallback ? "True" : "False") << ","
             << r.votes << "\n";
    }
}

void export_summary_csv(const std::string& filename,
                        const std::vector<RunSummary>& summaries) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file for writing: " + filename);
    }
    file << "Mode,Sub_Mode,Count,Mean_Frequency,Std_Frequency,Mean_Damping,"
            "Std_Damping,Mean_MAC,Outliers\n";
    for (const auto& s : summaries) {
        for (const auto& sm : s.sub_modes) {
            file << s.mode_number << "," << csv_field(sm.label) << "," << sm.count << ","
                 << csv_number(sm.mean_frequency) << ","
                 << csv_number(sm.std_frequency) << ","
                 << csv_number(sm.mean_damping) << ","
                 << csv_number(sm.std_damping) << ","
                 << csv_number(sm.mean_mac) << ","
                 << sm.outlier_count << "\n";
        }
    }
}

std::string format_summary(const RunSummary& s) {
    std::ostringstream out;
    out << "Mode " << s.mode_number << ": " << s.num_candidates << " candidates, "
        << s.num_matched << " matched, " << s.num_unmatched << " unmatched, "
        << s.num_rejected << " rejected\n";
    if (!s.error.empty()) {
        out << "  ERROR: " << s.error << "\n";
        return out.str();
    }
    if (s.selector.enabled) {
        out << "  best-MAC selection removed " << s.selector.total_removed
            << " candidates";
        for (const auto& kv : s.selector.winner_counts) {
            out << " " << kv.first << "=" << kv.second;
        }
        out << "\n";
    }
    out << "  analysed " << s.num_analysed << ", outliers " << s.num_outliers << "\n";
    for (const auto& m : s.methods) {
        out << "  " << std::left << std::setw(15) << method_name(m.method);
        if (m.ran) {
            out << " flagged " << m.num_flagged;
            if (m.used_fallback) out << " (univariate fallback)";
        } else {
            out << " skipped: " << m.failure_reason;
        }
        out << "\n";
    }
    out << std::fixed << std::setprecision(4);
    for (const auto& sm : s.sub_modes) {
        out << "  " << sm.label << ": n=" << sm.count
            << " f=" << sm.mean_frequency << "+/-" << sm.std_frequency << " Hz"
            << " zeta=" << sm.mean_damping
            << " MAC=" << sm.mean_mac
            << " outliers=" << sm.outlier_count << "\n";
    }
    for (const auto& w : s.warnings) {
        out << "  warning: " << w << "\n";
    }
    return out.str();
}

}  // namespace modalqc
