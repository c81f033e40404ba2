#include "modalqc/config.hpp"
#include "modalqc/engine.hpp"
#include "modalqc/candidate_io.hpp"
#include "modalqc/synthetic.hpp"
#include "modalqc/report.hpp"
#include <getopt.h>
#include <iostream>

using namespace modalqc;

#define OPT_CONFIG     320
#define OPT_CANDIDATES 321
#define OPT_SYNTHETIC  322
#define OPT_MODE       323
#define OPT_OUTPUT     324
#define OPT_SUMMARY    325
#define OPT_THREADS    326
#define OPT_SEED       327
#define OPT_ANOMALY    328
#define OPT_HELP       329

static const struct option long_opts[] =
{
    { "config",     required_argument, 0, OPT_CONFIG     },
    { "candidates", required_argument, 0, OPT_CANDIDATES },
    { "synthetic",  required_argument, 0, OPT_SYNTHETIC  },
    { "mode",       required_argument, 0, OPT_MODE       },
    { "output",     required_argument, 0, OPT_OUTPUT     },
    { "summary",    required_argument, 0, OPT_SUMMARY    },
    { "threads",    required_argument, 0, OPT_THREADS    },
    { "seed",       required_argument, 0, OPT_SEED       },
    { "anomaly",    required_argument, 0, OPT_ANOMALY    },
    { "help",       no_argument,       0, OPT_HELP       },
    { 0, 0, 0, 0 }
};

static void print_usage() {
    std::cout <<
        "Usage: modalqc_cli --config <cfg.json> (--candidates <in.csv> | --synthetic <N>)\n"
        "                   [--mode <M>] [--output <report.csv>] [--summary <summary.csv>]\n"
        "                   [--threads <T>] [--seed <S>] [--anomaly <segment>]...\n"
        "\n"
        "  --candidates  candidate table: mode,segment,frequency,damping_ratio,\n"
        "                detection_percentage,phi_1..phi_n\n"
        "  --synthetic   generate N synthetic segments per configured mode\n"
        "  --mode        analyse only this mode number\n"
        "  --anomaly     synthetic segment to corrupt (repeatable)\n";
}

int main(int argc, char** argv) {
    std::string config_path;
    std::string candidates_path;
    std::string output_path;
    std::string summary_path;
    int synthetic_segments = 0;
    int only_mode = 0;
    int threads = -1;
    unsigned int seed = 42;
    std::vector<int> anomalies;

    try {
        int next;
        int index = 0;
        while ((next = getopt_long(argc, argv, "", long_opts, &index)) != -1) {
            switch (next) {
                case OPT_CONFIG:     config_path = optarg; break;
                case OPT_CANDIDATES: candidates_path = optarg; break;
                case OPT_SYNTHETIC:  synthetic_segments = std::stoi(optarg); break;
                case OPT_MODE:       only_mode = std::stoi(optarg); break;
                case OPT_OUTPUT:     output_path = optarg; break;
                case OPT_SUMMARY:    summary_path = optarg; break;
                case OPT_THREADS:    threads = std::stoi(optarg); break;
                case OPT_SEED:       seed = static_cast<unsigned int>(std::stoul(optarg)); break;
                case OPT_ANOMALY:    anomalies.push_back(std::stoi(optarg)); break;
                case OPT_HELP:       print_usage(); return 0;
                default:             print_usage(); return 1;
            }
        }
    } catch (const std::logic_error&) {
        std::cerr << "Invalid numeric option value" << std::endl;
        return 1;
    }

    if (config_path.empty() || (candidates_path.empty() == (synthetic_segments <= 0))) {
        print_usage();
        return 1;
    }

    try {
        EngineConfig config = load_engine_config(config_path);
        if (threads >= 0) config.max_threads = threads;

        std::map<int, std::vector<RawCandidate>> candidates;
        if (!candidates_path.empty()) {
            candidates = load_candidates_csv(candidates_path);
        } else {
            SyntheticConfig syn;
            syn.num_segments = synthetic_segments;
            syn.anomaly_segments = anomalies;
            syn.seed = seed;
            for (int mode : config.references.mode_numbers()) {
                syn.base_frequency = 5.0 * mode;
                candidates[mode] = generate_synthetic_candidates(
                    syn, config.references.for_mode(mode));
            }
        }

        if (only_mode > 0) {
            auto it = candidates.find(only_mode);
            if (it == candidates.end()) {
                std::cerr << "No candidates for mode " << only_mode << std::endl;
                return 1;
            }
            std::map<int, std::vector<RawCandidate>> selected;
            selected[only_mode] = it->second;
            candidates.swap(selected);
        }

        OutlierEngine engine(config);
        std::vector<ModeAnalysis> analyses = engine.analyze_modes(candidates);

        std::vector<ReportRecord> all_records;
        std::vector<RunSummary> summaries;
        bool any_error = false;
        for (const auto& a : analyses) {
            std::cout << format_summary(a.summary);
            all_records.insert(all_records.end(), a.records.begin(), a.records.end());
            summaries.push_back(a.summary);
            if (!a.summary.error.empty()) any_error = true;
        }

        if (!output_path.empty()) {
            export_report_csv(output_path, all_records);
            std::cout << "Report written to " << output_path << std::endl;
        }
        if (!summary_path.empty()) {
            export_summary_csv(summary_path, summaries);
            std::cout << "Summary written to " << summary_path << std::endl;
        }
        return any_error ? 2 : 0;
    } catch (const std::exception& e) {
        std::cerr << "[modalqc] " << e.what() << std::endl;
        return 1;
    }
}
