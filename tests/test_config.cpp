#include <gtest/gtest.h>
#include "modalqc/config.hpp"

using namespace modalqc;
using json = nlohmann::ordered_json;

static std::string data_path(const std::string& name) {
    return std::string(TEST_DATA_DIR) + "/" + name;
}

static json minimal_doc() {
    return json::parse(R"({
        "modes": { "6": { "reference_shapes": { "6.1": [1, 0, 0], "6.2": [0, 1, 0] } } }
    })");
}

// ---- Loading ----

TEST(Config, LoadFile) {
    EngineConfig cfg = load_engine_config(data_path("mode6_config.json"));
    EXPECT_EQ(cfg.max_threads, 2);
    EXPECT_FALSE(cfg.parallel_methods);
    EXPECT_FALSE(cfg.verbose);

    ASSERT_TRUE(cfg.references.has_mode(6));
    ASSERT_TRUE(cfg.references.has_mode(8));
    EXPECT_EQ(cfg.references.for_mode(6).size(), 3u);
    EXPECT_EQ(cfg.references.channel_count(6), 4);
    EXPECT_EQ(cfg.references.for_mode(6)[1].label, "6.2");
    // Stored normalised
    EXPECT_NEAR(cfg.references.for_mode(8)[0].shape.norm(), 1.0, 1e-12);

    ModeConfig m6 = cfg.mode_config(6);
    EXPECT_DOUBLE_EQ(m6.min_match_mac, 0.2);
    EXPECT_FALSE(m6.best_mac_only);
    EXPECT_EQ(m6.trend_fit.band, TrendFitConfig::Band::LEAVE_ONE_OUT);

    ModeConfig m8 = cfg.mode_config(8);
    EXPECT_TRUE(m8.best_mac_only);
    EXPECT_EQ(m8.trend_fit.polynomial_degree, 1);
    EXPECT_EQ(m8.trend_fit.band, TrendFitConfig::Band::PREDICTION);
    // Unset keys keep defaults
    EXPECT_DOUBLE_EQ(m8.deviation_score.threshold, 2.0);
    EXPECT_DOUBLE_EQ(m8.joint_distance.distance_threshold, 2.5);
    EXPECT_DOUBLE_EQ(m8.trend_fit.confidence_level, 0.95);
}

TEST(Config, MinimalDocUsesDefaults) {
    EngineConfig cfg = parse_engine_config(minimal_doc());
    EXPECT_EQ(cfg.max_threads, 0);
    EXPECT_TRUE(cfg.verbose);
    ModeConfig mc = cfg.mode_config(6);
    EXPECT_DOUBLE_EQ(mc.min_match_mac, 0.2);
    EXPECT_DOUBLE_EQ(mc.joint_distance.mac_threshold, 0.35);
    EXPECT_EQ(mc.deviation_score.field, ScalarField::FREQUENCY);
    EXPECT_EQ(mc.trend_fit.band, TrendFitConfig::Band::LEAVE_ONE_OUT);
}

TEST(Config, ReferencesKeepDocumentOrder) {
    json doc = json::parse(R"({
        "modes": { "6": { "reference_shapes": {
            "6.2": [0, 1, 0], "6.10": [0, 0, 1], "6.1": [1, 0, 0] } } }
    })");
    EngineConfig cfg = parse_engine_config(doc);
    const auto& refs = cfg.references.for_mode(6);
    ASSERT_EQ(refs.size(), 3u);
    EXPECT_EQ(refs[0].label, "6.2");
    EXPECT_EQ(refs[1].label, "6.10");
    EXPECT_EQ(refs[2].label, "6.1");

    json out = engine_config_to_json(cfg);
    std::vector<std::string> keys;
    for (const auto& item : out["modes"]["6"]["reference_shapes"].items()) {
        keys.push_back(item.key());
    }
    EXPECT_EQ(keys, (std::vector<std::string>{"6.2", "6.10", "6.1"}));
}

TEST(Config, DampingField) {
    json doc = minimal_doc();
    doc["modes"]["6"]["deviation_score"] = {{"field", "damping_ratio"}};
    EngineConfig cfg = parse_engine_config(doc);
    EXPECT_EQ(cfg.mode_config(6).deviation_score.field, ScalarField::DAMPING_RATIO);
}

TEST(Config, RoundTripThroughJson) {
    EngineConfig a = load_engine_config(data_path("mode6_config.json"));
    EngineConfig b = parse_engine_config(engine_config_to_json(a));
    EXPECT_EQ(b.references.size(), a.references.size());
    EXPECT_EQ(b.max_threads, a.max_threads);
    EXPECT_EQ(b.mode_config(8).trend_fit.band, TrendFitConfig::Band::PREDICTION);
    EXPECT_TRUE(b.mode_config(8).best_mac_only);
    EXPECT_TRUE(b.references.for_mode(6)[2].shape.isApprox(a.references.for_mode(6)[2].shape));
}

// ---- Errors ----

TEST(Config, MissingFile_Throws) {
    EXPECT_THROW(load_engine_config(data_path("no_such_config.json")), std::runtime_error);
}

TEST(Config, MissingModes_Throws) {
    EXPECT_THROW(parse_engine_config(json::object()), std::invalid_argument);
    EXPECT_THROW(parse_engine_config(json::array()), std::invalid_argument);
}

TEST(Config, NonIntegerModeKey_Throws) {
    json doc = json::parse(R"({"modes": {"six": {"reference_shapes": {"6.1": [1, 0]}}}})");
    EXPECT_THROW(parse_engine_config(doc), std::invalid_argument);
}

TEST(Config, EmptyReferences_Throws) {
    json doc = json::parse(R"({"modes": {"6": {"reference_shapes": {}}}})");
    EXPECT_THROW(parse_engine_config(doc), std::invalid_argument);
}

TEST(Config, ReferenceChannelMismatch_Throws) {
    json doc = minimal_doc();
    doc["modes"]["6"]["reference_shapes"]["6.3"] = {0.0, 0.0, 1.0, 0.0};
    EXPECT_THROW(parse_engine_config(doc), std::invalid_argument);
}

TEST(Config, ZeroReference_Throws) {
    json doc = minimal_doc();
    doc["modes"]["6"]["reference_shapes"]["6.3"] = {0.0, 0.0, 0.0};
    EXPECT_THROW(parse_engine_config(doc), std::invalid_argument);
}

TEST(Config, UnknownBand_Throws) {
    json doc = minimal_doc();
    doc["modes"]["6"]["trend_fit"] = {{"band", "tolerance"}};
    EXPECT_THROW(parse_engine_config(doc), std::invalid_argument);

    doc["modes"]["6"]["trend_fit"] = {{"band", "confidence"}};
    EXPECT_THROW(parse_engine_config(doc), std::invalid_argument);
}

TEST(Config, WrongType_Throws) {
    json doc = minimal_doc();
    doc["modes"]["6"]["min_match_mac"] = "high";
    EXPECT_THROW(parse_engine_config(doc), std::invalid_argument);
}

TEST(Config, OutOfRange_Throws) {
    json doc = minimal_doc();
    doc["modes"]["6"]["min_match_mac"] = 1.5;
    EXPECT_THROW(parse_engine_config(doc), std::invalid_argument);

    doc = minimal_doc();
    doc["modes"]["6"]["trend_fit"] = {{"confidence_level", 1.2}};
    EXPECT_THROW(parse_engine_config(doc), std::invalid_argument);

    doc = minimal_doc();
    doc["max_threads"] = -1;
    EXPECT_THROW(parse_engine_config(doc), std::invalid_argument);
}

TEST(Config, ValidateRejectsModeWithoutReferences) {
    EngineConfig cfg;
    cfg.references.add(6, "6.1", Eigen::Vector3d(1, 0, 0));
    cfg.modes[7] = ModeConfig();
    EXPECT_THROW(cfg.validate(), std::invalid_argument);
    EXPECT_THROW(OutlierEngine engine(cfg), std::invalid_argument);
}
