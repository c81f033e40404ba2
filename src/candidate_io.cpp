#include "modalqc/candidate_io.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace modalqc {

static std::vector<std::string> split_csv_line(const std::string& line) {
    std::vector<std::string> fields;
    std::string field;
    std::istringstream iss(line);
    while (std::getline(iss, field, ',')) {
        // Trim surrounding whitespace
        size_t b = field.find_first_not_of(" \t");
        size_t e = field.find_last_not_of(" \t");
        fields.push_back(b == std::string::npos ? std::string() : field.substr(b, e - b + 1));
    }
    if (!line.empty() && line.back() == ',') fields.emplace_back();
    return fields;
}

static double parse_double(const std::string& s, int line_no, const std::string& column) {
    try {
        size_t pos = 0;
        double v = std::stod(s, &pos);
        if (pos != s.size()) throw std::invalid_argument(s);
        return v;
    } catch (const std::logic_error&) {
        throw std::runtime_error("Line " + std::to_string(line_no) + ": invalid " +
                                 column + " value '" + s + "'");
    }
}

static int parse_int(const std::string& s, int line_no, const std::string& column) {
    try {
        size_t pos = 0;
        int v = std::stoi(s, &pos);
        if (pos != s.size()) throw std::invalid_argument(s);
        return v;
    } catch (const std::logic_error&) {
        throw std::runtime_error("Line " + std::to_string(line_no) + ": invalid " +
                                 column + " value '" + s + "'");
    }
}

std::map<int, std::vector<RawCandidate>> load_candidates_csv(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open candidate file: " + filename);
    }

    static const char* fixed_columns[] = {
        "mode", "segment", "frequency", "damping_ratio", "detection_percentage"};
    constexpr int n_fixed = 5;

    std::map<int, std::vector<RawCandidate>> candidates;
    std::string line;
    int line_no = 0;
    int n_channels = -1;

    while (std::getline(file, line)) {
        line_no++;
        while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
            line.pop_back();
        }
        if (line.empty() || line[0] == '#') continue;

        std::vector<std::string> fields = split_csv_line(line);

        if (n_channels < 0) {
            // Header
            if (static_cast<int>(fields.size()) <= n_fixed) {
                throw std::runtime_error("Line " + std::to_string(line_no) +
                                         ": header needs at least one mode shape column");
            }
            for (int c = 0; c < n_fixed; c++) {
                if (fields[c] != fixed_columns[c]) {
                    throw std::runtime_error("Line " + std::to_string(line_no) +
                                             ": expected column '" + fixed_columns[c] +
                                             "', found '" + fields[c] + "'");
                }
            }
            n_channels = static_cast<int>(fields.size()) - n_fixed;
            continue;
        }

        if (static_cast<int>(fields.size()) != n_fixed + n_channels) {
            throw std::runtime_error("Line " + std::to_string(line_no) + ": expected " +
                                     std::to_string(n_fixed + n_channels) + " fields, found " +
                                     std::to_string(fields.size()));
        }

        int mode = parse_int(fields[0], line_no, "mode");
        RawCandidate c;
        c.segment_id = parse_int(fields[1], line_no, "segment");
        c.frequency = parse_double(fields[2], line_no, "frequency");
        c.damping_ratio = parse_double(fields[3], line_no, "damping_ratio");
        c.detection_percentage = parse_double(fields[4], line_no, "detection_percentage");
        c.mode_shape.resize(n_channels);
        for (int k = 0; k < n_channels; k++) {
            c.mode_shape(k) = parse_double(fields[n_fixed + k], line_no,
                                           "phi_" + std::to_string(k + 1));
        }

        if (mode <= 0) {
            throw std::runtime_error("Line " + std::to_string(line_no) +
                                     ": mode number must be positive");
        }
        if (c.segment_id <= 0) {
            throw std::runtime_error("Line " + std::to_string(line_no) +
                                     ": segment id must be positive");
        }
        if (!(c.frequency > 0.0)) {
            throw std::runtime_error("Line " + std::to_string(line_no) +
                                     ": frequency must be positive");
        }
        candidates[mode].push_back(std::move(c));
    }

    if (n_channels < 0) {
        throw std::runtime_error("Candidate file has no header: " + filename);
    }
    return candidates;
}

void export_candidates_csv(const std::string& filename,
                           const std::map<int, std::vector<RawCandidate>>& candidates_by_mode) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file for writing: " + filename);
    }

    int n_channels = 0;
    for (const auto& kv : candidates_by_mode) {
        for (const auto& c : kv.second) {
            n_channels = std::max(n_channels, static_cast<int>(c.mode_shape.size()));
        }
    }

    file << "mode,segment,frequency,damping_ratio,detection_percentage";
    for (int k = 0; k < n_channels; k++) file << ",phi_" << (k + 1);
    file << "\n";
    file << std::setprecision(12);

    for (const auto& kv : candidates_by_mode) {
        for (const auto& c : kv.second) {
            if (c.mode_shape.size() != n_channels) {
                throw std::invalid_argument(
                    "export_candidates_csv: all mode shapes must have the same length");
            }
            file << kv.first << "," << c.segment_id << "," << c.frequency << ","
                 << c.damping_ratio << "," << c.detection_percentage;
            for (int k = 0; k < n_channels; k++) file << "," << c.mode_shape(k);
            file << "\n";
        }
    }
}

}  // namespace modalqc
