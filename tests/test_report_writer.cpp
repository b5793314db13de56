#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <sstream>
#include "report_writer.hpp"
#include "sample_series.hpp"

class ReportWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() / "shutterscope_report_tests";
        std::filesystem::create_directories(test_dir);

        config.log_level = "error";
        config.json_output_path = (test_dir / "nested" / "report.json").string();
        config.csv_output_path = (test_dir / "events.csv").string();
        config.enable_csv_report = true;

        analysis = analyzer.analyze(sample_brightness_series(), 240.0);
        results = analyzer.evaluate(analysis, {"1/20", "fast"});
    }

    void TearDown() override {
        if (std::filesystem::exists(test_dir)) {
            std::filesystem::remove_all(test_dir);
        }
    }

    static std::string read_file(const std::string& path) {
        std::ifstream in(path);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    std::filesystem::path test_dir;
    OutputConfig config;
    BatchAnalyzer analyzer;
    BatchAnalysis analysis;
    std::vector<SpeedResult> results;
};

TEST_F(ReportWriterTest, BuildsReport) {
    ReportWriter writer(config);
    const auto j = writer.build_report("sample.csv", analysis, results);

    EXPECT_EQ(j["source"], "sample.csv");
    EXPECT_EQ(j["status"], "ok");
    EXPECT_DOUBLE_EQ(j["threshold_model"]["threshold"].get<double>(), 23.0);
    ASSERT_EQ(j["events"].size(), 3u);
    EXPECT_EQ(j["events"][0]["start_frame"], 10);
    EXPECT_EQ(j["events"][0]["duration_frames"], 12);
    EXPECT_DOUBLE_EQ(j["events"][0]["baseline_brightness"].get<double>(), 20.0);
    EXPECT_NEAR(j["events"][2]["peak_brightness"].get<double>(), 2156.0 / 12.0, 1e-9);
    ASSERT_EQ(j["results"].size(), 3u);
    EXPECT_EQ(j["results"][0]["expected_speed"], "1/20");
    EXPECT_TRUE(j["results"][0]["accuracy"].is_string());
    EXPECT_TRUE(j["results"][1]["deviation_percent"].is_null());
    EXPECT_TRUE(j["results"][2]["expected_speed"].is_null());
    EXPECT_TRUE(j["average_abs_deviation_percent"].is_number());
}

TEST_F(ReportWriterTest, WritesJsonAndCsv) {
    ReportWriter writer(config);
    ASSERT_TRUE(writer.write("sample.csv", analysis, results));

    ASSERT_TRUE(std::filesystem::exists(config.json_output_path));
    const auto j = nlohmann::json::parse(read_file(config.json_output_path));
    EXPECT_EQ(j["events"].size(), 3u);

    const auto csv = read_file(config.csv_output_path);
    std::istringstream lines(csv);
    std::string line;
    int count = 0;
    while (std::getline(lines, line)) {
        if (!line.empty()) count++;
    }
    EXPECT_EQ(count, 4);  // header + 3 events
    EXPECT_EQ(csv.rfind("index,start_frame,end_frame", 0), 0u);
    EXPECT_NE(csv.find("1,10,21,12,"), std::string::npos);
}

TEST_F(ReportWriterTest, DisabledReportsAreSkipped) {
    config.enable_json_report = false;
    config.enable_csv_report = false;
    ReportWriter writer(config);
    EXPECT_TRUE(writer.write("sample.csv", analysis, results));
    EXPECT_FALSE(std::filesystem::exists(config.json_output_path));
    EXPECT_FALSE(std::filesystem::exists(config.csv_output_path));
}

TEST_F(ReportWriterTest, UnwritablePathFails) {
    config.enable_csv_report = false;
    config.json_output_path = test_dir.string();  // a directory
    ReportWriter writer(config);
    EXPECT_FALSE(writer.write("sample.csv", analysis, results));
}

TEST_F(ReportWriterTest, ConstructionKeepsGlobalLogLevel) {
    const auto before = spdlog::get_level();
    spdlog::set_level(spdlog::level::warn);
    config.log_level = "debug";
    ReportWriter writer(config);
    EXPECT_EQ(spdlog::get_level(), spdlog::level::warn);
    spdlog::set_level(before);
}

TEST(SessionSnapshotJsonTest, SerializesState) {
    SessionSnapshot s;
    s.state = CalibrationState::ARMED;
    s.frames_processed = 64;
    ThresholdModel m;
    m.baseline = 20.0;
    m.threshold = 164.0;
    m.peak = 200.0;
    s.model = m;
    ShutterEvent ev;
    ev.start_frame = 65;
    ev.end_frame = 67;
    ev.brightness_values = {180.0, 190.0, 180.0};
    s.events = std::make_shared<const std::vector<ShutterEvent>>(std::vector<ShutterEvent>{ev});

    const nlohmann::json j = s;
    EXPECT_EQ(j["state"], "armed");
    EXPECT_EQ(j["frames_processed"], 64);
    EXPECT_DOUBLE_EQ(j["model"]["peak"].get<double>(), 200.0);
    EXPECT_TRUE(j["model"]["std_dev"].is_null());
    EXPECT_TRUE(j["last_sample"].is_null());
    ASSERT_EQ(j["events"].size(), 1u);
    EXPECT_EQ(j["events"][0]["duration_frames"], 3);
    EXPECT_TRUE(j["events"][0]["baseline_brightness"].is_null());
    EXPECT_TRUE(j["events"][0]["peak_brightness"].is_null());
}
