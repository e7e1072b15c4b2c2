#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <memory>
#include <string>
#include "Report.hh"
#include "ReportStd.hh"
#include "Debug.hh"
#include "Variables.hh"
#include "ProcessTable.hh"
#include "FeatureTable.hh"
#include "SramConfig.hh"
#include "SramState.hh"
#include "Error.hh"
#include "PowerModel.hh"
#include "ReportSram.hh"

namespace sram {

class PowerModelTest : public ::testing::Test {
protected:
  class TestState : public SramState
  {
  public:
    TestState(Report *report,
              Debug *debug,
              Variables *variables,
              ProcessTable *process_table,
              const FeatureTable *feature_table)
    {
      report_ = report;
      debug_ = debug;
      variables_ = variables;
      process_table_ = process_table;
      feature_table_ = feature_table;
    }
  };

  void SetUp() override {
    report_.reset(makeReportStd());
    debug_ = std::make_unique<Debug>(report_.get());
    state_ = std::make_unique<TestState>(report_.get(), debug_.get(),
                                         &variables_, &process_table_,
                                         &feature_table_);
    model_ = std::make_unique<PowerModel>(state_.get());
    fields_.depth = 1024;
    fields_.width = 32;
    fields_.banks = 1;
    fields_.voltage = 1.0;
    fields_.process_node = 28;
  }

  PowerEstimate power(const SramConfigFields &fields,
                      double activity,
                      double frequency = 0.0) {
    SramConfig config(fields, &process_table_);
    return model_->power(config, activity, frequency);
  }

  std::unique_ptr<Report> report_;
  std::unique_ptr<Debug> debug_;
  Variables variables_;
  ProcessTable process_table_;
  FeatureTable feature_table_;
  std::unique_ptr<TestState> state_;
  std::unique_ptr<PowerModel> model_;
  SramConfigFields fields_;
};

TEST_F(PowerModelTest, Nominal28) {
  PowerEstimate estimate = power(fields_, 0.1);
  double access = 0.35 + 0.012 * 32.0 + 0.2 * 0.55 / 0.65;
  double fmax = 1000.0 / (access + 0.12);
  EXPECT_DOUBLE_EQ(estimate.activity_factor, 0.1);
  EXPECT_NEAR(estimate.frequency_mhz, fmax, 1e-6);
  // 0.05 pF * 32 columns * 1V^2 * fmax MHz * 0.1
  EXPECT_NEAR(estimate.dynamic_power_mw, 0.05 * 32 * fmax * 0.1 * 1e-3, 1e-9);
  // 1.35 * 0.004161536 mm^2 * 20 mW/mm^2/V * 1V
  EXPECT_NEAR(estimate.static_power_mw, 0.004161536 * 1.35 * 20.0, 1e-9);
  EXPECT_EQ(estimate.retention_power_uw, 0.0);
}

TEST_F(PowerModelTest, TotalIsSum) {
  for (int flags = 0; flags < 16; flags++) {
    fields_.ecc_enable = flags & 1;
    fields_.clock_gating = flags & 2;
    fields_.power_gating = flags & 4;
    fields_.retention_mode = flags & 8;
    fields_.banks = 1 << (flags % 5);
    PowerEstimate estimate = power(fields_, 0.05 * flags / 16.0 + 0.2);
    EXPECT_EQ(estimate.total_power_mw,
              estimate.dynamic_power_mw + estimate.static_power_mw);
  }
}

TEST_F(PowerModelTest, RetentionZeroWithoutMode) {
  fields_.power_gating = true;
  fields_.clock_gating = true;
  PowerEstimate estimate = power(fields_, 0.5);
  EXPECT_EQ(estimate.retention_power_uw, 0.0);
}

TEST_F(PowerModelTest, RetentionBounds) {
  fields_.retention_mode = true;
  for (int flags = 0; flags < 8; flags++) {
    fields_.ecc_enable = flags & 1;
    fields_.clock_gating = flags & 2;
    fields_.power_gating = flags & 4;
    PowerEstimate estimate = power(fields_, 0.1);
    EXPECT_GT(estimate.retention_power_uw, 0.0);
    EXPECT_LT(estimate.retention_power_uw, estimate.static_power_mw * 1000.0);
  }
}

TEST_F(PowerModelTest, RetentionNotInTotal) {
  PowerEstimate plain = power(fields_, 0.1);
  fields_.retention_mode = true;
  PowerEstimate retention = power(fields_, 0.1);
  // Only the retention periphery adds leakage.
  EXPECT_GT(retention.total_power_mw, plain.total_power_mw);
  EXPECT_LT(retention.total_power_mw - plain.total_power_mw,
            retention.retention_power_uw / 1000.0);
}

TEST_F(PowerModelTest, DynamicIncreasesWithActivity) {
  double prev_dynamic = -1.0;
  for (int i = 0; i <= 10; i++) {
    double activity = i / 10.0;
    PowerEstimate estimate = power(fields_, activity);
    EXPECT_GT(estimate.dynamic_power_mw, prev_dynamic);
    prev_dynamic = estimate.dynamic_power_mw;
  }
}

TEST_F(PowerModelTest, ZeroActivity) {
  fields_.ecc_enable = true;
  PowerEstimate estimate = power(fields_, 0.0);
  EXPECT_EQ(estimate.dynamic_power_mw, 0.0);
  EXPECT_GT(estimate.static_power_mw, 0.0);
  EXPECT_EQ(estimate.total_power_mw, estimate.static_power_mw);
}

TEST_F(PowerModelTest, PowerGatingReducesStatic) {
  for (int flags = 0; flags < 8; flags++) {
    fields_.ecc_enable = flags & 1;
    fields_.clock_gating = flags & 2;
    fields_.retention_mode = flags & 4;
    fields_.power_gating = false;
    PowerEstimate ungated = power(fields_, 0.3);
    fields_.power_gating = true;
    PowerEstimate gated = power(fields_, 0.3);
    EXPECT_LE(gated.static_power_mw, ungated.static_power_mw);
  }
}

TEST_F(PowerModelTest, ClockGatingReducesDynamic) {
  for (int flags = 0; flags < 8; flags++) {
    fields_.ecc_enable = flags & 1;
    fields_.power_gating = flags & 2;
    fields_.retention_mode = flags & 4;
    fields_.clock_gating = false;
    PowerEstimate ungated = power(fields_, 0.3);
    fields_.clock_gating = true;
    PowerEstimate gated = power(fields_, 0.3);
    EXPECT_LE(gated.dynamic_power_mw, ungated.dynamic_power_mw);
  }
}

TEST_F(PowerModelTest, ClockGatingAtFixedFrequency) {
  PowerEstimate ungated = power(fields_, 0.3, 500.0);
  fields_.clock_gating = true;
  PowerEstimate gated = power(fields_, 0.3, 500.0);
  EXPECT_NEAR(gated.dynamic_power_mw, ungated.dynamic_power_mw * 0.75, 1e-12);
}

TEST_F(PowerModelTest, InvalidActivity) {
  try {
    power(fields_, 1.5);
    FAIL();
  }
  catch (const InvalidActivityFactorError &error) {
    EXPECT_DOUBLE_EQ(error.activity(), 1.5);
  }
  EXPECT_THROW(power(fields_, -0.1), InvalidActivityFactorError);
  EXPECT_THROW(power(fields_, std::numeric_limits<double>::quiet_NaN()),
               InvalidActivityFactorError);
  EXPECT_NO_THROW(power(fields_, 1.0));
}

TEST_F(PowerModelTest, ActivityCheckedFirst) {
  // Both the activity and the voltage are bad.
  fields_.process_node = 7;
  fields_.voltage = 1.0;
  EXPECT_THROW(power(fields_, 2.0), InvalidActivityFactorError);
  EXPECT_THROW(power(fields_, 0.5), ModelRangeError);
}

TEST_F(PowerModelTest, OperatingFrequency) {
  PowerEstimate at_max = power(fields_, 0.2);
  double half = at_max.frequency_mhz / 2.0;
  PowerEstimate at_half = power(fields_, 0.2, half);
  EXPECT_DOUBLE_EQ(at_half.frequency_mhz, half);
  EXPECT_NEAR(at_half.dynamic_power_mw, at_max.dynamic_power_mw / 2.0, 1e-12);
  EXPECT_DOUBLE_EQ(at_half.static_power_mw, at_max.static_power_mw);
}

TEST_F(PowerModelTest, FrequencyAboveMax) {
  PowerEstimate at_max = power(fields_, 0.2);
  try {
    power(fields_, 0.2, at_max.frequency_mhz * 2.0);
    FAIL();
  }
  catch (const ModelRangeError &error) {
    EXPECT_STREQ(error.quantity(), "frequency");
  }
  EXPECT_THROW(power(fields_, 0.2, -10.0), ModelRangeError);
}

TEST_F(PowerModelTest, FrequencyRoundedToMax) {
  PowerEstimate at_max = power(fields_, 0.2);
  double rounded = at_max.frequency_mhz * (1.0 + 1e-12);
  PowerEstimate at_rounded = power(fields_, 0.2, rounded);
  EXPECT_DOUBLE_EQ(at_rounded.frequency_mhz, at_max.frequency_mhz);
  EXPECT_DOUBLE_EQ(at_rounded.dynamic_power_mw, at_max.dynamic_power_mw);
}

TEST_F(PowerModelTest, DefaultActivity) {
  SramConfig config(fields_, &process_table_);
  PowerEstimate estimate = model_->power(config);
  EXPECT_DOUBLE_EQ(estimate.activity_factor, 0.1);
  variables_.setDefaultActivity(0.4);
  estimate = model_->power(config);
  EXPECT_DOUBLE_EQ(estimate.activity_factor, 0.4);
}

TEST_F(PowerModelTest, DefaultActivityRange) {
  EXPECT_THROW(variables_.setDefaultActivity(1.01), InvalidActivityFactorError);
  EXPECT_DOUBLE_EQ(variables_.defaultActivity(), 0.1);
}

TEST_F(PowerModelTest, StaticScalesWithVoltage) {
  fields_.voltage = 0.8;
  PowerEstimate low = power(fields_, 0.1);
  fields_.voltage = 1.0;
  PowerEstimate high = power(fields_, 0.1);
  EXPECT_NEAR(high.static_power_mw / low.static_power_mw, 1.25, 1e-12);
}

////////////////////////////////////////////////////////////////

class ReportSramTest : public PowerModelTest {
protected:
  void SetUp() override {
    PowerModelTest::SetUp();
    reporter_ = std::make_unique<ReportSram>(state_.get());
  }

  std::unique_ptr<ReportSram> reporter_;
};

TEST_F(ReportSramTest, ReportConfig) {
  fields_.ecc_enable = true;
  fields_.clock_gating = true;
  SramConfig config(fields_, &process_table_);
  report_->redirectStringBegin();
  reporter_->reportConfig(config, 3);
  std::string output = report_->redirectStringEnd();
  EXPECT_NE(output.find("sram_1024x32_b1"), std::string::npos);
  EXPECT_NE(output.find("ecc_enable clock_gating"), std::string::npos);
  EXPECT_NE(output.find("7 check bits, 39 bit code"), std::string::npos);
  EXPECT_NE(output.find(config.fingerprint()), std::string::npos);
}

TEST_F(ReportSramTest, ReportPowerRetention) {
  SramConfig config(fields_, &process_table_);
  PowerEstimate estimate = model_->power(config, 0.1);
  report_->redirectStringBegin();
  reporter_->reportPower(config, estimate, 3);
  std::string output = report_->redirectStringEnd();
  EXPECT_NE(output.find("n/a"), std::string::npos);
  EXPECT_NE(output.find("mW"), std::string::npos);
}

TEST_F(ReportSramTest, ReportPowerSweep) {
  SramConfig config(fields_, &process_table_);
  PowerEstimateSeq powers;
  powers.push_back(model_->power(config, 0.0));
  powers.push_back(model_->power(config, 0.5));
  report_->redirectStringBegin();
  reporter_->reportPowerSweep(powers, 4);
  std::string output = report_->redirectStringEnd();
  EXPECT_NE(output.find("Activity"), std::string::npos);
  EXPECT_NE(output.find("0.000 "), std::string::npos);
  EXPECT_NE(output.find("0.500 "), std::string::npos);
  // Title, units, dashes and two rows.
  int lines = 0;
  for (char ch : output)
    if (ch == '\n')
      lines++;
  EXPECT_EQ(lines, 5);
}

} // namespace sram
