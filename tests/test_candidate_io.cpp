#include <gtest/gtest.h>
#include "modalqc/candidate_io.hpp"
#include <cstdio>
#include <fstream>

using namespace modalqc;

static std::string data_path(const std::string& name) {
    return std::string(TEST_DATA_DIR) + "/" + name;
}

static std::string write_temp(const std::string& name, const std::string& content) {
    std::string path = ::testing::TempDir() + name;
    std::ofstream out(path);
    out << content;
    return path;
}

TEST(CandidateIO, LoadFixture) {
    auto by_mode = load_candidates_csv(data_path("candidates_small.csv"));
    ASSERT_EQ(by_mode.size(), 2u);
    ASSERT_EQ(by_mode.at(6).size(), 3u);
    ASSERT_EQ(by_mode.at(8).size(), 2u);

    const RawCandidate& c = by_mode.at(6)[1];
    EXPECT_EQ(c.segment_id, 1);
    EXPECT_DOUBLE_EQ(c.frequency, 25.52);
    EXPECT_DOUBLE_EQ(c.damping_ratio, 0.018);
    EXPECT_DOUBLE_EQ(c.detection_percentage, 0.8);
    ASSERT_EQ(c.mode_shape.size(), 4);
    EXPECT_DOUBLE_EQ(c.mode_shape(1), 0.98);

    EXPECT_EQ(by_mode.at(6)[2].segment_id, 2);
}

TEST(CandidateIO, ExportThenLoad) {
    std::map<int, std::vector<RawCandidate>> by_mode;
    RawCandidate c;
    c.segment_id = 3;
    c.frequency = 12.345678901;
    c.damping_ratio = 0.0125;
    c.detection_percentage = 0.66;
    c.mode_shape = Eigen::Vector3d(0.1, -0.2, 0.97);
    by_mode[2].push_back(c);

    std::string path = ::testing::TempDir() + "modalqc_candidates_export.csv";
    export_candidates_csv(path, by_mode);
    auto loaded = load_candidates_csv(path);
    std::remove(path.c_str());

    ASSERT_EQ(loaded.at(2).size(), 1u);
    const RawCandidate& r = loaded.at(2)[0];
    EXPECT_EQ(r.segment_id, 3);
    EXPECT_NEAR(r.frequency, c.frequency, 1e-9);
    EXPECT_TRUE(r.mode_shape.isApprox(c.mode_shape, 1e-10));
}

TEST(CandidateIO, WindowsLineEndings) {
    std::string path = write_temp("modalqc_crlf.csv",
        "mode,segment,frequency,damping_ratio,detection_percentage,phi_1,phi_2\r\n"
        "4,1,10.5,0.01,0.9,1.0,0.0\r\n");
    auto loaded = load_candidates_csv(path);
    std::remove(path.c_str());
    ASSERT_EQ(loaded.at(4).size(), 1u);
    EXPECT_DOUBLE_EQ(loaded.at(4)[0].mode_shape(1), 0.0);
}

// ---- Errors ----

TEST(CandidateIO, MissingFile_Throws) {
    EXPECT_THROW(load_candidates_csv(data_path("missing.csv")), std::runtime_error);
}

TEST(CandidateIO, BadHeader_Throws) {
    std::string path = write_temp("modalqc_badheader.csv",
        "mode,seg,frequency,damping_ratio,detection_percentage,phi_1\n");
    EXPECT_THROW(load_candidates_csv(path), std::runtime_error);
    std::remove(path.c_str());
}

TEST(CandidateIO, NoShapeColumns_Throws) {
    std::string path = write_temp("modalqc_noshape.csv",
        "mode,segment,frequency,damping_ratio,detection_percentage\n");
    EXPECT_THROW(load_candidates_csv(path), std::runtime_error);
    std::remove(path.c_str());
}

TEST(CandidateIO, EmptyFile_Throws) {
    std::string path = write_temp("modalqc_empty.csv", "# nothing here\n");
    EXPECT_THROW(load_candidates_csv(path), std::runtime_error);
    std::remove(path.c_str());
}

TEST(CandidateIO, MalformedRows_ReportLineNumber) {
    const std::string header =
        "mode,segment,frequency,damping_ratio,detection_percentage,phi_1,phi_2\n";
    const std::vector<std::string> bad_rows = {
        "6,1,25.0,0.02,0.9,1.0\n",          // too few fields
        "6,1,abc,0.02,0.9,1.0,0.0\n",       // not a number
        "0,1,25.0,0.02,0.9,1.0,0.0\n",      // mode
        "6,-2,25.0,0.02,0.9,1.0,0.0\n",     // segment
        "6,1,-25.0,0.02,0.9,1.0,0.0\n",     // frequency
    };
    for (const auto& row : bad_rows) {
        std::string path = write_temp("modalqc_badrow.csv", header + row);
        try {
            load_candidates_csv(path);
            ADD_FAILURE() << "no exception for row: " << row;
        } catch (const std::runtime_error& e) {
            EXPECT_NE(std::string(e.what()).find("Line 2"), std::string::npos) << e.what();
        }
        std::remove(path.c_str());
    }
}

TEST(CandidateIO, ExportMixedLengths_Throws) {
    std::map<int, std::vector<RawCandidate>> by_mode;
    RawCandidate a, b;
    a.segment_id = 1;
    a.frequency = 10.0;
    a.mode_shape = Eigen::Vector3d(1, 0, 0);
    b = a;
    b.mode_shape = Eigen::Vector2d(1, 0);
    by_mode[1] = {a, b};
    std::string path = ::testing::TempDir() + "modalqc_mixed.csv";
    EXPECT_THROW(export_candidates_csv(path, by_mode), std::invalid_argument);
    std::remove(path.c_str());
}
