#pragma once

#include "modalqc/engine.hpp"
#include <nlohmann/json.hpp>

namespace modalqc {

// Build an EngineConfig from a parsed JSON document:
//
//   { "max_threads": 0, "parallel_methods": false, "verbose": true,
//     "modes": { "6": { "reference_shapes": { "6.1": [...], ... },
//                       "min_match_mac": 0.2, "best_mac_only": false,
//                       "deviation_score": { "threshold": 2.0, "field": "frequency" },
//                       "trend_fit": { "confidence_level": 0.95,
//                                      "polynomial_degree": 2,
//                                      "band": "leave_one_out" },
//                       "joint_distance": { "mac_threshold": 0.35,
//                                           "distance_threshold": 2.5 } } } }
//
// Missing optional keys keep their defaults. Throws std::invalid_argument
// naming the offending key for malformed or out-of-range values.
EngineConfig parse_engine_config(const nlohmann::ordered_json& doc);

// Read and parse a JSON config file. std::runtime_error if unreadable.
EngineConfig load_engine_config(const std::string& filename);

// Inverse of parse_engine_config (reference shapes as stored, unit norm)
nlohmann::ordered_json engine_config_to_json(const EngineConfig& config);

}  // namespace modalqc
