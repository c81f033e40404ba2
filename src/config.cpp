#include "modalqc/config.hpp"
#include <fstream>

namespace modalqc {

static ScalarField parse_field(const std::string& name, const std::string& where) {
    if (name == "frequency") return ScalarField::FREQUENCY;
    if (name == "damping_ratio") return ScalarField::DAMPING_RATIO;
    throw std::invalid_argument(where + ".field: unknown scalar '" + name + "'");
}

static std::string field_name(ScalarField field) {
    return (field == ScalarField::DAMPING_RATIO) ? "damping_ratio" : "frequency";
}

static ModeConfig parse_mode_config(const nlohmann::ordered_json& j, const std::string& where) {
    ModeConfig mc;
    mc.min_match_mac = j.value("min_match_mac", mc.min_match_mac);
    mc.best_mac_only = j.value("best_mac_only", mc.best_mac_only);

    if (j.contains("deviation_score")) {
        const auto& ds = j.at("deviation_score");
        mc.deviation_score.threshold = ds.value("threshold", mc.deviation_score.threshold);
        if (ds.contains("field")) {
            mc.deviation_score.field =
                parse_field(ds.at("field").get<std::string>(), where + ".deviation_score");
        }
    }

    if (j.contains("trend_fit")) {
        const auto& tf = j.at("trend_fit");
        mc.trend_fit.confidence_level =
            tf.value("confidence_level", mc.trend_fit.confidence_level);
        mc.trend_fit.polynomial_degree =
            tf.value("polynomial_degree", mc.trend_fit.polynomial_degree);
        std::string band = tf.value("band", std::string("leave_one_out"));
        if (band == "leave_one_out") {
            mc.trend_fit.band = TrendFitConfig::Band::LEAVE_ONE_OUT;
        } else if (band == "prediction") {
            mc.trend_fit.band = TrendFitConfig::Band::PREDICTION;
        } else {
            throw std::invalid_argument(where + ".trend_fit.band: unknown band '" + band + "'");
        }
        if (tf.contains("field")) {
            mc.trend_fit.field =
                parse_field(tf.at("field").get<std::string>(), where + ".trend_fit");
        }
    }

    if (j.contains("joint_distance")) {
        const auto& jd = j.at("joint_distance");
        mc.joint_distance.mac_threshold =
            jd.value("mac_threshold", mc.joint_distance.mac_threshold);
        mc.joint_distance.distance_threshold =
            jd.value("distance_threshold", mc.joint_distance.distance_threshold);
    }
    return mc;
}

EngineConfig parse_engine_config(const nlohmann::ordered_json& doc) {
    if (!doc.is_object()) {
        throw std::invalid_argument("Config root must be a JSON object");
    }

    EngineConfig config;
    try {
        config.max_threads = doc.value("max_threads", config.max_threads);
        config.parallel_methods = doc.value("parallel_methods", config.parallel_methods);
        config.verbose = doc.value("verbose", config.verbose);

        if (!doc.contains("modes") || !doc.at("modes").is_object()) {
            throw std::invalid_argument("Config requires a 'modes' object");
        }

        for (const auto& item : doc.at("modes").items()) {
            const std::string where = "modes." + item.key();
            int mode_number = 0;
            try {
                size_t pos = 0;
                mode_number = std::stoi(item.key(), &pos);
                if (pos != item.key().size()) throw std::invalid_argument(item.key());
            } catch (const std::logic_error&) {
                throw std::invalid_argument(where + ": mode key must be an integer");
            }

            const nlohmann::ordered_json& mj = item.value();
            if (!mj.contains("reference_shapes") || !mj.at("reference_shapes").is_object() ||
                mj.at("reference_shapes").empty()) {
                throw std::invalid_argument(where + ": 'reference_shapes' must be a non-empty object");
            }
            for (const auto& ref : mj.at("reference_shapes").items()) {
                std::vector<double> values = ref.value().get<std::vector<double>>();
                Eigen::VectorXd shape = Eigen::Map<Eigen::VectorXd>(
                    values.data(), static_cast<Eigen::Index>(values.size()));
                try {
                    config.references.add(mode_number, ref.key(), shape);
                } catch (const std::invalid_argument& e) {
                    throw std::invalid_argument(
                        where + ".reference_shapes." + ref.key() + ": " + e.what());
                }
            }

            config.modes[mode_number] = parse_mode_config(mj, where);
        }
    } catch (const nlohmann::ordered_json::exception& e) {
        throw std::invalid_argument(std::string("Malformed config: ") + e.what());
    }

    config.validate();
    return config;
}

EngineConfig load_engine_config(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + filename);
    }
    nlohmann::ordered_json doc;
    try {
        file >> doc;
    } catch (const nlohmann::ordered_json::parse_error& e) {
        throw std::runtime_error("Cannot parse config file " + filename + ": " + e.what());
    }
    return parse_engine_config(doc);
}

nlohmann::ordered_json engine_config_to_json(const EngineConfig& config) {
    nlohmann::ordered_json doc;
    doc["max_threads"] = config.max_threads;
    doc["parallel_methods"] = config.parallel_methods;
    doc["verbose"] = config.verbose;
    doc["modes"] = nlohmann::ordered_json::object();

    for (int mode : config.references.mode_numbers()) {
        ModeConfig mc = config.mode_config(mode);
        nlohmann::ordered_json mj;
        nlohmann::ordered_json refs = nlohmann::ordered_json::object();
        for (const auto& r : config.references.for_mode(mode)) {
            refs[r.label] = std::vector<double>(r.shape.data(), r.shape.data() + r.shape.size());
        }
        mj["reference_shapes"] = refs;
        mj["min_match_mac"] = mc.min_match_mac;
        mj["best_mac_only"] = mc.best_mac_only;
        mj["deviation_score"] = {
            {"threshold", mc.deviation_score.threshold},
            {"field", field_name(mc.deviation_score.field)}};
        mj["trend_fit"] = {
            {"confidence_level", mc.trend_fit.confidence_level},
            {"polynomial_degree", mc.trend_fit.polynomial_degree},
            {"band", mc.trend_fit.band == TrendFitConfig::Band::PREDICTION ? "prediction"
                                                                          : "leave_one_out"},
            {"field", field_name(mc.trend_fit.field)}};
        mj["joint_distance"] = {
            {"mac_threshold", mc.joint_distance.mac_threshold},
            {"distance_threshold", mc.joint_distance.distance_threshold}};
        doc["modes"][std::to_string(mode)] = mj;
    }
    return doc;
}

}  // namespace modalqc
