#include <gtest/gtest.h>
#include <variant>
#include "calibration_controller.hpp"

class CalibrationControllerTest : public ::testing::Test {
protected:
    // 60 frames alternating 20/21: baseline 20, stddev 0.5, max 21
    void feed_baseline() {
        for (int i = 0; i < 60; ++i) {
            ctrl.process_frame(i % 2 == 0 ? 20.0 : 21.0, next_ts());
        }
    }

    int64_t next_ts() {
        const int64_t ts = frame * 4'166'667;
        frame++;
        return ts;
    }

    CalibrationController ctrl;
    int64_t frame = 0;
};

TEST_F(CalibrationControllerTest, StartsIdle) {
    EXPECT_EQ(ctrl.state(), CalibrationState::IDLE);
    EXPECT_FALSE(ctrl.armed());
    EXPECT_FALSE(ctrl.model().has_value());
    EXPECT_FALSE(ctrl.process_frame(200.0, 0).has_value());
    EXPECT_EQ(ctrl.state(), CalibrationState::IDLE);
}

TEST_F(CalibrationControllerTest, StartOnlyFromIdle) {
    EXPECT_TRUE(ctrl.start());
    EXPECT_EQ(ctrl.state(), CalibrationState::COLLECTING_BASELINE);
    EXPECT_FALSE(ctrl.start());
}

TEST_F(CalibrationControllerTest, BaselineProgressIsReported) {
    ctrl.start();
    auto r = ctrl.process_frame(20.0, next_ts());
    ASSERT_TRUE(r.has_value());
    ASSERT_TRUE(std::holds_alternative<BaselineProgress>(*r));
    EXPECT_NEAR(std::get<BaselineProgress>(*r).fraction, 1.0f / 60.0f, 1e-6);

    for (int i = 1; i < 30; ++i) ctrl.process_frame(20.0, next_ts());
    EXPECT_NEAR(ctrl.baseline_progress(), 0.5f, 1e-6);
}

TEST_F(CalibrationControllerTest, FullCalibrationSequence) {
    ctrl.start();
    feed_baseline();

    EXPECT_EQ(ctrl.state(), CalibrationState::AWAITING_CALIBRATION_SHUTTER);
    EXPECT_FLOAT_EQ(ctrl.baseline_progress(), 1.0f);
    EXPECT_DOUBLE_EQ(ctrl.baseline(), 20.0);
    // max(20 + 5 * 0.5, 20 + 50, 21 * 2)
    EXPECT_DOUBLE_EQ(ctrl.preliminary_threshold(), 70.0);

    // noise below the preliminary threshold keeps waiting
    EXPECT_FALSE(ctrl.process_frame(45.0, next_ts()).has_value());
    EXPECT_EQ(ctrl.state(), CalibrationState::AWAITING_CALIBRATION_SHUTTER);

    EXPECT_FALSE(ctrl.process_frame(200.0, next_ts()).has_value());
    EXPECT_EQ(ctrl.state(), CalibrationState::CAPTURING_CALIBRATION_EVENT);
    EXPECT_FALSE(ctrl.process_frame(180.0, next_ts()).has_value());

    auto r = ctrl.process_frame(20.0, next_ts());
    ASSERT_TRUE(r.has_value());
    ASSERT_TRUE(std::holds_alternative<CalibrationComplete>(*r));
    const auto& m = std::get<CalibrationComplete>(*r).model;

    EXPECT_EQ(ctrl.state(), CalibrationState::ARMED);
    EXPECT_TRUE(ctrl.armed());
    EXPECT_DOUBLE_EQ(m.baseline, 20.0);
    ASSERT_TRUE(m.peak.has_value());
    EXPECT_DOUBLE_EQ(*m.peak, 200.0);
    EXPECT_DOUBLE_EQ(m.threshold, 20.0 + 180.0 * 0.8);
    ASSERT_TRUE(m.std_dev.has_value());
    EXPECT_DOUBLE_EQ(*m.std_dev, 0.5);
    ASSERT_TRUE(ctrl.last_calibration_frame().has_value());
    EXPECT_DOUBLE_EQ(*ctrl.last_calibration_frame(), 20.0);
}

TEST_F(CalibrationControllerTest, ArmedIgnoresFurtherFrames) {
    ctrl.start();
    feed_baseline();
    ctrl.process_frame(200.0, next_ts());
    ctrl.process_frame(20.0, next_ts());
    ASSERT_TRUE(ctrl.armed());

    EXPECT_FALSE(ctrl.process_frame(250.0, next_ts()).has_value());
    EXPECT_FALSE(ctrl.process_frame(20.0, next_ts()).has_value());
    EXPECT_EQ(ctrl.state(), CalibrationState::ARMED);
}

TEST_F(CalibrationControllerTest, NoisyBaselineRaisesPreliminaryThreshold) {
    ctrl.start();
    for (int i = 0; i < 60; ++i) ctrl.process_frame(i == 59 ? 60.0 : 20.0, next_ts());
    // the max-seen term dominates: 60 * 2
    EXPECT_DOUBLE_EQ(ctrl.preliminary_threshold(), 120.0);
}

TEST_F(CalibrationControllerTest, ResetReturnsToIdle) {
    ctrl.start();
    feed_baseline();
    ctrl.process_frame(200.0, next_ts());
    ctrl.process_frame(20.0, next_ts());
    ASSERT_TRUE(ctrl.armed());

    ctrl.reset();
    EXPECT_EQ(ctrl.state(), CalibrationState::IDLE);
    EXPECT_FALSE(ctrl.model().has_value());
    EXPECT_FLOAT_EQ(ctrl.baseline_progress(), 0.0f);
    EXPECT_DOUBLE_EQ(ctrl.preliminary_threshold(), 0.0);
    EXPECT_TRUE(ctrl.start());
}

TEST(CalibrationConfigTest, BaselineFramesClampedToOne) {
    CalibrationConfig cfg;
    cfg.baseline_frames = 0;
    CalibrationController ctrl(cfg);
    EXPECT_EQ(ctrl.config().baseline_frames, 1);

    ctrl.start();
    auto r = ctrl.process_frame(10.0, 0);
    ASSERT_TRUE(r.has_value());
    EXPECT_FLOAT_EQ(std::get<BaselineProgress>(*r).fraction, 1.0f);
    EXPECT_EQ(ctrl.state(), CalibrationState::AWAITING_CALIBRATION_SHUTTER);
}
