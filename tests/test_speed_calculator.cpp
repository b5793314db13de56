#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "speed_calculator.hpp"

class SpeedCalculatorTest : public ::testing::Test {
protected:
    static ShutterEvent event_of(int64_t start, int64_t frames, double level = 200.0) {
        ShutterEvent ev;
        ev.start_frame = start;
        ev.end_frame = start + frames - 1;
        ev.brightness_values.assign(static_cast<size_t>(frames), level);
        return ev;
    }

    SpeedCalculator calc;
};

TEST_F(SpeedCalculatorTest, DenominatorFromFrameCount) {
    EXPECT_NEAR(SpeedCalculator::calculate_shutter_speed(3.0, 240.0), 80.0, 1e-9);
    EXPECT_NEAR(SpeedCalculator::calculate_shutter_speed(4.0, 240.0), 60.0, 1e-9);
    EXPECT_NEAR(SpeedCalculator::calculate_shutter_speed(240.0, 240.0), 1.0, 1e-9);
}

TEST_F(SpeedCalculatorTest, MeasureUsesWeightedDurationWhenAvailable) {
    ShutterEvent ev;
    ev.start_frame = 0;
    ev.end_frame = 6;
    ev.brightness_values = {20.0, 60.0, 100.0, 100.0, 100.0, 60.0, 20.0};

    EXPECT_NEAR(SpeedCalculator::measure(ev, 240.0), 240.0 / 7.0, 1e-9);  // no baseline
    ev.baseline_brightness = 20.0;
    EXPECT_NEAR(SpeedCalculator::measure(ev, 240.0), 48.0, 1e-9);
    EXPECT_NEAR(SpeedCalculator::measure(ev, 240.0, false), 240.0 / 7.0, 1e-9);
}

TEST_F(SpeedCalculatorTest, DurationSecondsWithSlowMotion) {
    EXPECT_NEAR(SpeedCalculator::duration_seconds(12.0, 240.0), 12.0 / 240.0, 1e-12);
    // 240 fps footage played back as 30 fps
    EXPECT_NEAR(SpeedCalculator::duration_seconds(12.0, 30.0, 240.0), 12.0 / 240.0, 1e-12);
}

TEST_F(SpeedCalculatorTest, SlowMotionPlaybackMeasuresCaptureSpeed) {
    const auto ev = event_of(0, 4);
    EXPECT_NEAR(SpeedCalculator::measure(ev, 30.0), 7.5, 1e-9);
    EXPECT_NEAR(SpeedCalculator::measure(ev, 30.0, true, 240.0), 60.0, 1e-9);

    const auto r = calc.evaluate(ev, 30.0, std::string("1/60"), true, 240.0);
    EXPECT_NEAR(r.measured_speed_denominator, 60.0, 1e-9);
    ASSERT_TRUE(r.deviation_percent.has_value());
    EXPECT_NEAR(*r.deviation_percent, 0.0, 1e-9);
}

TEST_F(SpeedCalculatorTest, ParsesSpeedNotation) {
    EXPECT_DOUBLE_EQ(*SpeedCalculator::parse_speed_seconds("1/500"), 0.002);
    EXPECT_DOUBLE_EQ(*SpeedCalculator::parse_speed_seconds(" 1 / 250 "), 0.004);
    EXPECT_DOUBLE_EQ(*SpeedCalculator::parse_speed_seconds("2"), 2.0);
    EXPECT_DOUBLE_EQ(*SpeedCalculator::parse_speed_seconds("0.5"), 0.5);
    EXPECT_DOUBLE_EQ(*SpeedCalculator::parse_speed_seconds("1s"), 1.0);
    EXPECT_DOUBLE_EQ(*SpeedCalculator::parse_speed_seconds("2s"), 2.0);
}

TEST_F(SpeedCalculatorTest, RejectsInvalidNotation) {
    for (const std::string bad : {"", "abc", "1/0", "0", "-1/60", "1/abc", "1/60x", "/60"}) {
        EXPECT_FALSE(SpeedCalculator::parse_speed_seconds(bad).has_value()) << bad;
    }
}

TEST_F(SpeedCalculatorTest, ParsesSpeedList) {
    const auto l = SpeedCalculator::parse_speed_list(" 1/500, 1/250 ,,1s ");
    ASSERT_EQ(l.size(), 3u);
    EXPECT_EQ(l[0], "1/500");
    EXPECT_EQ(l[1], "1/250");
    EXPECT_EQ(l[2], "1s");
    EXPECT_TRUE(SpeedCalculator::parse_speed_list("").empty());
}

TEST_F(SpeedCalculatorTest, DeviationSign) {
    EXPECT_NEAR(SpeedCalculator::deviation_percent(0.0025, 0.002), 25.0, 1e-9);
    EXPECT_NEAR(SpeedCalculator::deviation_percent(0.0015, 0.002), -25.0, 1e-9);
}

TEST_F(SpeedCalculatorTest, FormatsShutterSpeed) {
    EXPECT_EQ(SpeedCalculator::format_shutter_speed(80.0), "1/80");
    EXPECT_EQ(SpeedCalculator::format_shutter_speed(79.9999), "1/80");
    EXPECT_EQ(SpeedCalculator::format_shutter_speed(1.0), "1/1");
    EXPECT_EQ(SpeedCalculator::format_shutter_speed(0.5), "2.00s");
}

TEST_F(SpeedCalculatorTest, AccuracyLabels) {
    EXPECT_EQ(SpeedCalculator::accuracy_label(0.0), "Good");
    EXPECT_EQ(SpeedCalculator::accuracy_label(-5.0), "Good");
    EXPECT_EQ(SpeedCalculator::accuracy_label(7.5), "Fair");
    EXPECT_EQ(SpeedCalculator::accuracy_label(-15.0), "Poor");
    EXPECT_EQ(SpeedCalculator::accuracy_label(40.0), "Bad");
}

TEST_F(SpeedCalculatorTest, EvaluateAgainstExpectedSpeed) {
    const auto r = calc.evaluate(event_of(0, 4), 240.0, std::string("1/60"));
    EXPECT_NEAR(r.measured_speed_denominator, 60.0, 1e-9);
    EXPECT_NEAR(r.measured_duration_s, 1.0 / 60.0, 1e-12);
    ASSERT_TRUE(r.expected_duration_s.has_value());
    ASSERT_TRUE(r.deviation_percent.has_value());
    EXPECT_NEAR(*r.deviation_percent, 0.0, 1e-9);
}

TEST_F(SpeedCalculatorTest, UnparseableExpectedSpeedLeavesDeviationUnknown) {
    const auto r = calc.evaluate(event_of(0, 4), 240.0, std::string("fast"));
    ASSERT_TRUE(r.expected_speed.has_value());
    EXPECT_EQ(*r.expected_speed, "fast");
    EXPECT_FALSE(r.expected_duration_s.has_value());
    EXPECT_FALSE(r.deviation_percent.has_value());
    EXPECT_NEAR(r.measured_speed_denominator, 60.0, 1e-9);
}

TEST_F(SpeedCalculatorTest, GroupsByDetectionOrder) {
    // fired 1/60 first, then 1/120: a short event after a long one
    const std::vector<ShutterEvent> events{event_of(10, 4), event_of(100, 2), event_of(200, 8)};
    const std::vector<std::string> expected{"1/60", "1/120"};

    const auto results = calc.group_events(events, expected, 240.0);
    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(*results[0].expected_speed, "1/60");
    EXPECT_NEAR(*results[0].deviation_percent, 0.0, 1e-9);
    EXPECT_EQ(*results[1].expected_speed, "1/120");
    EXPECT_NEAR(*results[1].deviation_percent, 0.0, 1e-9);
    EXPECT_FALSE(results[2].expected_speed.has_value());
    EXPECT_FALSE(results[2].deviation_percent.has_value());
}

TEST_F(SpeedCalculatorTest, SurplusExpectedSpeedsIgnored) {
    const auto results = calc.group_events({event_of(0, 3)}, {"1/80", "1/40", "1/20"}, 240.0);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(*results[0].expected_speed, "1/80");
}

TEST_F(SpeedCalculatorTest, AverageAbsoluteDeviation) {
    std::vector<SpeedResult> results(3);
    results[0].deviation_percent = 10.0;
    results[1].deviation_percent = -20.0;
    const auto avg = SpeedCalculator::average_abs_deviation(results);
    ASSERT_TRUE(avg.has_value());
    EXPECT_DOUBLE_EQ(*avg, 15.0);

    EXPECT_FALSE(SpeedCalculator::average_abs_deviation({SpeedResult{}}).has_value());
}
