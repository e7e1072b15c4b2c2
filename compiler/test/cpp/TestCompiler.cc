#include <gtest/gtest.h>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>
#include <unistd.h>
#include "SramCompiler.hh"
#include "Report.hh"
#include "Error.hh"
#include "Variables.hh"
#include "ProcessTable.hh"
#include "RtlGenerator.hh"

namespace sram {

static SramConfigValues
baseValues()
{
  return {{"depth", "1024"},
          {"width", "32"},
          {"banks", "1"},
          {"voltage", "1.0"},
          {"process_node", "28"},
          {"power_gating", "false"},
          {"clock_gating", "true"},
          {"retention_mode", "true"},
          {"ecc_enable", "false"}};
}

static std::string
readFile(const char *filename)
{
  std::string text;
  FILE *stream = fopen(filename, "r");
  if (stream) {
    char buffer[4096];
    size_t length;
    while ((length = fread(buffer, 1, sizeof(buffer), stream)) > 0)
      text.append(buffer, length);
    fclose(stream);
  }
  return text;
}

class SramCompilerTest : public ::testing::Test {
protected:
  void SetUp() override {
    compiler_ = std::make_unique<SramCompiler>();
    compiler_->makeComponents();
  }

  std::unique_ptr<SramCompiler> compiler_;
};

TEST_F(SramCompilerTest, NoConfig) {
  EXPECT_EQ(compiler_->config(), nullptr);
  EXPECT_THROW(compiler_->area(), ExceptionMsg);
  EXPECT_THROW(compiler_->timing(), ExceptionMsg);
  EXPECT_THROW(compiler_->power(), ExceptionMsg);
  EXPECT_THROW(compiler_->writeVerilog("/tmp"), ExceptionMsg);
}

TEST_F(SramCompilerTest, SetConfig) {
  compiler_->setConfig(baseValues());
  ASSERT_NE(compiler_->config(), nullptr);
  EXPECT_EQ(compiler_->config()->moduleName(), "sram_1024x32_b1");
  AreaEstimate area = compiler_->area();
  EXPECT_GT(area.total_area_mm2, 0.0);
  TimingEstimate timing = compiler_->timing();
  EXPECT_EQ(timing.max_frequency_mhz, 1000.0 / timing.cycle_time_ns);
  PowerEstimate power = compiler_->power();
  EXPECT_DOUBLE_EQ(power.activity_factor, 0.1);
  EXPECT_GT(power.retention_power_uw, 0.0);
}

TEST_F(SramCompilerTest, BadConfigKeepsPrevious) {
  compiler_->setConfig(baseValues());
  std::string fingerprint = compiler_->config()->fingerprint();
  SramConfigValues values = baseValues();
  values["banks"] = "3";
  EXPECT_THROW(compiler_->setConfig(values), ConfigurationError);
  ASSERT_NE(compiler_->config(), nullptr);
  EXPECT_EQ(compiler_->config()->fingerprint(), fingerprint);
}

TEST_F(SramCompilerTest, DepthWarning) {
  SramConfigValues values = baseValues();
  values["depth"] = "1000";
  values["banks"] = "8";
  Report *report = compiler_->report();
  report->redirectStringBegin();
  compiler_->setConfig(values);
  std::string output = report->redirectStringEnd();
  EXPECT_EQ(output, "Warning: depth 1000 is not a power of two.\n");
}

TEST_F(SramCompilerTest, ThreadCount) {
  EXPECT_EQ(compiler_->threadCount(), 1);
  compiler_->setThreadCount(4);
  EXPECT_EQ(compiler_->threadCount(), 4);
  EXPECT_THROW(compiler_->setThreadCount(0), ExceptionMsg);
  EXPECT_EQ(compiler_->threadCount(), 4);
}

TEST_F(SramCompilerTest, PowerSweepOrder) {
  compiler_->setConfig(baseValues());
  ActivitySeq activities;
  for (int i = 20; i >= 0; i--)
    activities.push_back(i / 20.0);
  PowerEstimateSeq serial = compiler_->powerSweep(activities);
  compiler_->setThreadCount(4);
  PowerEstimateSeq parallel = compiler_->powerSweep(activities);
  ASSERT_EQ(serial.size(), activities.size());
  ASSERT_EQ(parallel.size(), activities.size());
  for (size_t i = 0; i < activities.size(); i++) {
    EXPECT_EQ(parallel[i].activity_factor, activities[i]);
    EXPECT_EQ(parallel[i].dynamic_power_mw, serial[i].dynamic_power_mw);
    EXPECT_EQ(parallel[i].total_power_mw, serial[i].total_power_mw);
  }
}

TEST_F(SramCompilerTest, PowerSweepInvalidActivity) {
  compiler_->setConfig(baseValues());
  compiler_->setThreadCount(2);
  ActivitySeq activities = {0.1, 0.2, 1.5, 0.3};
  try {
    compiler_->powerSweep(activities);
    FAIL();
  }
  catch (const InvalidActivityFactorError &error) {
    EXPECT_DOUBLE_EQ(error.activity(), 1.5);
  }
}

TEST_F(SramCompilerTest, PowerSweepModelRange) {
  SramConfigValues values = baseValues();
  values["process_node"] = "7";
  compiler_->setConfig(values);
  compiler_->setThreadCount(3);
  EXPECT_THROW(compiler_->powerSweep(SramCompiler::defaultSweepActivities()),
               ModelRangeError);
}

TEST_F(SramCompilerTest, DefineProcessNode) {
  compiler_->defineProcessNode(ProcessNode(22, 0.1, 0.7, 1.0, 0.85, 0.33, 0.3,
                                           0.011, 0.18, 0.11, 0.04, 25.0));
  SramConfigValues values = baseValues();
  values["process_node"] = "22";
  values["voltage"] = "0.85";
  compiler_->setConfig(values);
  EXPECT_EQ(compiler_->config()->process().node(), 22);
  EXPECT_GT(compiler_->timing().max_frequency_mhz, 0.0);
}

TEST_F(SramCompilerTest, ReportDesign) {
  compiler_->setConfig(baseValues());
  Report *report = compiler_->report();
  report->redirectStringBegin();
  compiler_->reportDesign(0.25);
  std::string output = report->redirectStringEnd();
  EXPECT_NE(output.find("SRAM configuration"), std::string::npos);
  EXPECT_NE(output.find("Area"), std::string::npos);
  EXPECT_NE(output.find("Timing"), std::string::npos);
  EXPECT_NE(output.find("Power"), std::string::npos);
  EXPECT_NE(output.find("Retention"), std::string::npos);
  EXPECT_NE(output.find("0.250"), std::string::npos);
}

TEST_F(SramCompilerTest, ReportDesignError) {
  SramConfigValues values = baseValues();
  values["process_node"] = "7";
  compiler_->setConfig(values);
  Report *report = compiler_->report();
  report->redirectStringBegin();
  EXPECT_THROW(compiler_->reportDesign(0.1), ModelRangeError);
  std::string output = report->redirectStringEnd();
  EXPECT_TRUE(output.empty());
}

TEST_F(SramCompilerTest, WriteReport) {
  compiler_->setConfig(baseValues());
  char filename[] = "/tmp/sram_report_XXXXXX";
  int fd = mkstemp(filename);
  ASSERT_GE(fd, 0);
  close(fd);
  compiler_->writeReport(filename, 0.1);
  std::string text = readFile(filename);
  remove(filename);
  EXPECT_EQ(text.find("SRAM configuration"), 0u);
  EXPECT_NE(text.find(compiler_->config()->fingerprint()), std::string::npos);
}

TEST_F(SramCompilerTest, WriteReportUnwritable) {
  compiler_->setConfig(baseValues());
  EXPECT_THROW(compiler_->writeReport("/nonexistent_dir/sram.rpt", 0.1),
               FileNotWritable);
}

TEST_F(SramCompilerTest, WriteVerilog) {
  compiler_->setConfig(baseValues());
  char templ[] = "/tmp/sram_compiler_XXXXXX";
  ASSERT_NE(mkdtemp(templ), nullptr);
  std::string dir = templ;
  StringSeq names = compiler_->writeVerilog(dir.c_str());
  ASSERT_EQ(names.size(), 2u);
  EXPECT_EQ(names[0], "sram_1024x32_b1.v");
  EXPECT_EQ(names[1], "sram_1024x32_b1_clk_gate.v");
  for (const std::string &name : names)
    EXPECT_EQ(unlink((dir + "/" + name).c_str()), 0);
  unlink((dir + "/" + RtlGenerator::lock_filename).c_str());
  EXPECT_EQ(rmdir(dir.c_str()), 0);
}

TEST(VariablesTest, Defaults) {
  Variables variables;
  EXPECT_DOUBLE_EQ(variables.defaultActivity(), 0.1);
  EXPECT_EQ(variables.reportDigits(), 3);
  variables.setReportDigits(5);
  EXPECT_EQ(variables.reportDigits(), 5);
  variables.setDefaultActivity(0.0);
  EXPECT_DOUBLE_EQ(variables.defaultActivity(), 0.0);
  EXPECT_THROW(variables.setDefaultActivity(-0.5), InvalidActivityFactorError);
}

} // namespace sram
