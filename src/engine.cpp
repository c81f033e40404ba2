#include "modalqc/engine.hpp"
#include "modalqc/mac.hpp"
#include "modalqc/candidate_selector.hpp"
#include "modalqc/ensemble.hpp"
#include <algorithm>
#include <atomic>
#include <iostream>
#include <optional>
#include <thread>

namespace modalqc {

ModeConfig EngineConfig::mode_config(int mode_number) const {
    auto it = modes.find(mode_number);
    return (it != modes.end()) ? it->second : ModeConfig();
}

void EngineConfig::validate() const {
    for (const auto& kv : modes) {
        const std::string where = "mode " + std::to_string(kv.first) + ": ";
        const ModeConfig& mc = kv.second;
        if (!references.has_mode(kv.first)) {
            throw std::invalid_argument(where + "no reference shapes");
        }
        if (!(mc.min_match_mac >= 0.0 && mc.min_match_mac <= 1.0)) {
            throw std::invalid_argument(where + "min_match_mac must be in [0, 1]");
        }
        // Method constructors carry the parameter checks
        try {
            DeviationScoreMethod ds(mc.deviation_score);
            TrendFitMethod tf(mc.trend_fit);
            JointDistanceMethod jd(mc.joint_distance);
        } catch (const std::invalid_argument& e) {
            throw std::invalid_argument(where + e.what());
        }
    }
    if (max_threads < 0) {
        throw std::invalid_argument("max_threads must be non-negative");
    }
}

OutlierEngine::OutlierEngine(EngineConfig config)
    : config_(std::move(config)) {
    config_.validate();
}

void OutlierEngine::log(int mode_number, const std::string& message) const {
    if (config_.verbose) {
        std::cerr << "[OutlierEngine] mode " << mode_number << ": " << message << std::endl;
    }
}

std::vector<DetectionMethod> OutlierEngine::build_methods(int mode_number) const {
    ModeConfig mc = config_.mode_config(mode_number);
    std::vector<DetectionMethod> methods;
    methods.emplace_back(DeviationScoreMethod(mc.deviation_score));
    methods.emplace_back(TrendFitMethod(mc.trend_fit));
    methods.emplace_back(JointDistanceMethod(mc.joint_distance));
    return methods;
}

std::vector<MethodResult> OutlierEngine::run_methods(
    const std::vector<DetectionMethod>& methods,
    const std::vector<ModeObservation>& group) const
{
    int n_methods = static_cast<int>(methods.size());
    std::vector<MethodResult> results(n_methods);

    // Each method works on its own copy of the group; nothing is shared
    auto run_one = [&methods, &results](int i, std::vector<ModeObservation> local) {
        try {
            results[i] = run_method(methods[i], local);
        } catch (const std::exception& e) {
            MethodResult failed;
            failed.method = method_kind(methods[i]);
            failed.ran = false;
            failed.failure_reason = std::string("Error: ") + e.what();
            results[i] = std::move(failed);
        }
    };

    if (config_.parallel_methods && n_methods > 1) {
        std::vector<std::thread> workers;
        workers.reserve(n_methods);
        for (int i = 0; i < n_methods; i++) {
            workers.emplace_back(run_one, i, group);
        }
        for (auto& t : workers) t.join();
    } else {
        for (int i = 0; i < n_methods; i++) {
            run_one(i, group);
        }
    }
    return results;
}

ModeAnalysis OutlierEngine::analyze_mode(
    int mode_number, const std::vector<RawCandidate>& candidates) const
{
    const auto& refs = config_.references.for_mode(mode_number);
    if (refs.empty()) {
        throw std::invalid_argument(
            "No reference shapes configured for mode " + std::to_string(mode_number));
    }
    ModeConfig mc = config_.mode_config(mode_number);

    ModeAnalysis analysis;
    analysis.mode_number = mode_number;
    RunSummary& summary = analysis.summary;
    summary.mode_number = mode_number;
    summary.num_candidates = static_cast<int>(candidates.size());

    for (const auto& pair : config_.references.ambiguous_pairs(mode_number)) {
        summary.warnings.push_back("Reference shapes " + pair.first + " and " +
                                   pair.second + " are nearly collinear");
    }

    // Step 1: MAC matching
    MacMatcher matcher(refs, mc.min_match_mac);
    std::vector<ModeObservation> matched;
    matched.reserve(candidates.size());
    for (const auto& outcome : matcher.match_all(candidates, mode_number)) {
        switch (outcome.status) {
            case MatchOutcome::Status::MATCHED:
                matched.push_back(outcome.observation);
                break;
            case MatchOutcome::Status::UNMATCHED:
                summary.num_unmatched++;
                summary.excluded.push_back(
                    {outcome.segment_id, outcome.reason, outcome.detail});
                break;
            case MatchOutcome::Status::REJECTED:
                summary.num_rejected++;
                summary.excluded.push_back(
                    {outcome.segment_id, outcome.reason, outcome.detail});
                break;
        }
    }
    summary.num_matched = static_cast<int>(matched.size());

    // Step 2: optional best-MAC selection
    std::vector<ModeObservation> group;
    if (mc.best_mac_only) {
        SelectionResult sel = select_best_candidates(matched);
        summary.selector.enabled = true;
        summary.selector.total_removed = sel.total_removed;
        summary.selector.removed_per_segment = sel.removed_per_segment;
        summary.selector.winner_counts = sel.winner_counts;
        group = std::move(sel.observations);
    } else {
        group = std::move(matched);
    }
    summary.num_analysed = static_cast<int>(group.size());

    // Step 3: independent detection methods
    std::vector<MethodResult> method_results = run_methods(build_methods(mode_number), group);
    for (const auto& mr : method_results) {
        MethodStatus st;
        st.method = mr.method;
        st.ran = mr.ran;
        st.failure_reason = mr.failure_reason;
        st.used_fallback = mr.used_fallback;
        st.num_flagged = mr.num_flagged();
        summary.methods.push_back(st);
        if (!mr.ran) {
            summary.warnings.push_back(method_name(mr.method) + " skipped: " + mr.failure_reason);
        }
        for (const auto& w : mr.warnings) {
            summary.warnings.push_back(w);
        }
    }

    // Step 4: ensemble and report
    std::vector<EnsembleResult> ensemble = combine(group, method_results);
    analysis.records = assemble_report(group, method_results, ensemble);
    summary.sub_modes = compute_sub_mode_statistics(analysis.records);
    for (const auto& r : analysis.records) {
        if (r.is_outlier) summary.num_outliers++;
    }

    for (const auto& w : summary.warnings) {
        log(mode_number, w);
    }
    return analysis;
}

std::vector<ModeAnalysis> OutlierEngine::analyze_modes(
    const std::map<int, std::vector<RawCandidate>>& candidates_by_mode) const
{
    std::vector<int> mode_numbers;
    mode_numbers.reserve(candidates_by_mode.size());
    for (const auto& kv : candidates_by_mode) mode_numbers.push_back(kv.first);
    int n_modes = static_cast<int>(mode_numbers.size());
    if (n_modes == 0) return {};

    auto analyze_one = [&](int mode_number) {
        try {
            return analyze_mode(mode_number, candidates_by_mode.at(mode_number));
        } catch (const std::exception& e) {
            if (config_.verbose) {
                std::cerr << "[OutlierEngine] mode " << mode_number
                          << " FAILED: " << e.what() << std::endl;
            }
            ModeAnalysis failed;
            failed.mode_number = mode_number;
            failed.summary.mode_number = mode_number;
            failed.summary.num_candidates =
                static_cast<int>(candidates_by_mode.at(mode_number).size());
            failed.summary.error = e.what();
            return failed;
        }
    };

    int max_concurrent = (config_.max_threads > 0) ? config_.max_threads
        : std::max(1, static_cast<int>(std::thread::hardware_concurrency()));
    max_concurrent = std::min(max_concurrent, n_modes);

    // Each slot is written by exactly one worker, so the output keeps mode order
    std::atomic<int> next_idx{0};
    std::vector<std::optional<ModeAnalysis>> results_vec(n_modes);

    std::vector<std::thread> workers;
    workers.reserve(max_concurrent);
    for (int w = 0; w < max_concurrent; w++) {
        workers.emplace_back([&]() {
            while (true) {
                int idx = next_idx.fetch_add(1, std::memory_order_relaxed);
                if (idx >= n_modes) break;
                results_vec[idx] = analyze_one(mode_numbers[idx]);
            }
        });
    }
    for (auto& t : workers) t.join();

    std::vector<ModeAnalysis> results;
    results.reserve(n_modes);
    for (auto& opt : results_vec) {
        if (opt.has_value()) {
            results.push_back(std::move(*opt));
        }
    }
    return results;
}

}  // namespace modalqc
