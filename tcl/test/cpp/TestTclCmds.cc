#include <gtest/gtest.h>
#include <cstdlib>
#include <memory>
#include <new>
#include <string>
#include <tcl.h>
#include <unistd.h>
#include "Report.hh"
#include "SramCompiler.hh"
#include "SramTclCmds.hh"
#include "Variables.hh"
#include "RtlGenerator.hh"

namespace sram {

static const char *base_config =
  "set_sram_config {depth 1024 width 32 banks 1 voltage 1.0 process_node 28"
  " power_gating false clock_gating false retention_mode false ecc_enable false}";

class SramTclCmdsTest : public ::testing::Test {
protected:
  void SetUp() override {
    Tcl_FindExecutable(nullptr);
    interp_ = Tcl_CreateInterp();
    compiler_ = std::make_unique<SramCompiler>();
    compiler_->makeComponents();
    SramCompiler::setSramCompiler(compiler_.get());
    ASSERT_EQ(Sram_Init(interp_), TCL_OK);
  }

  void TearDown() override {
    SramCompiler::setSramCompiler(nullptr);
    Tcl_DeleteInterp(interp_);
  }

  // Eval script and return the interpreter result.
  int eval(const char *script,
           std::string &result) {
    int code = Tcl_Eval(interp_, script);
    result = Tcl_GetStringResult(interp_);
    return code;
  }

  std::string evalOk(const char *script) {
    std::string result;
    EXPECT_EQ(eval(script, result), TCL_OK) << script << ": " << result;
    return result;
  }

  std::string evalError(const char *script) {
    std::string result;
    EXPECT_EQ(eval(script, result), TCL_ERROR) << script;
    return result;
  }

  Tcl_Interp *interp_;
  std::unique_ptr<SramCompiler> compiler_;
};

TEST_F(SramTclCmdsTest, SetConfig) {
  EXPECT_EQ(evalOk(base_config), "sram_1024x32_b1");
  ASSERT_NE(compiler_->config(), nullptr);
  EXPECT_EQ(compiler_->config()->depth(), 1024);
}

TEST_F(SramTclCmdsTest, NamespacedCommand) {
  EXPECT_EQ(evalOk("::sram::sram_process_nodes"), "180 130 90 65 45 28 16 7");
  EXPECT_EQ(evalOk("sram_process_nodes"), "180 130 90 65 45 28 16 7");
  EXPECT_FALSE(evalOk("sram_version").empty());
}

TEST_F(SramTclCmdsTest, ConfigurationError) {
  std::string result = evalError(
    "set_sram_config {depth 1024 width 32 banks 3 voltage 1.0 process_node 28"
    " power_gating false clock_gating false retention_mode false ecc_enable false}");
  EXPECT_NE(result.find("banks = '3'"), std::string::npos);
  EXPECT_EQ(compiler_->config(), nullptr);
  result = evalError("set_sram_config {depth 1024}");
  EXPECT_EQ(result, "configuration field width is missing.");
}

TEST_F(SramTclCmdsTest, NoConfig) {
  std::string result = evalError("sram_estimate area");
  EXPECT_NE(result.find("no SRAM configuration"), std::string::npos);
}

TEST_F(SramTclCmdsTest, GetConfig) {
  evalOk(base_config);
  EXPECT_EQ(evalOk("dict get [get_sram_config] module_name"), "sram_1024x32_b1");
  EXPECT_EQ(evalOk("dict get [get_sram_config] address_width"), "10");
  EXPECT_EQ(evalOk("dict get [get_sram_config] fingerprint"),
            compiler_->config()->fingerprint());
}

TEST_F(SramTclCmdsTest, EstimateArea) {
  evalOk(base_config);
  EXPECT_EQ(evalOk("lsort [dict keys [sram_estimate area]]"),
            "area_efficiency bank_area_mm2 bitcell_area_mm2 periphery_area_mm2"
            " total_area_mm2");
  EXPECT_EQ(evalOk("set a [sram_estimate area]\n"
                   "expr {[dict get $a area_efficiency] > 0.0"
                   " && [dict get $a area_efficiency] <= 1.0}"),
            "1");
}

TEST_F(SramTclCmdsTest, EstimateTiming) {
  evalOk(base_config);
  EXPECT_EQ(evalOk("lsort [dict keys [sram_estimate timing]]"),
            "access_time_ns cycle_time_ns max_frequency_mhz");
}

TEST_F(SramTclCmdsTest, EstimatePower) {
  evalOk(base_config);
  EXPECT_EQ(evalOk("lsort [dict keys [sram_estimate power]]"),
            "activity_factor dynamic_power_mw frequency_mhz"
            " retention_power_uw static_power_mw total_power_mw");
  EXPECT_EQ(evalOk("dict get [sram_estimate power -activity 0.25] activity_factor"),
            "0.25");
  EXPECT_EQ(evalOk("dict get [sram_estimate power -activity 0] dynamic_power_mw"),
            "0.0");
  EXPECT_EQ(evalOk("dict get [sram_estimate power] retention_power_uw"), "0.0");
  EXPECT_EQ(evalOk("dict get [sram_estimate power -frequency 100] frequency_mhz"),
            "100.0");
}

TEST_F(SramTclCmdsTest, InvalidActivity) {
  evalOk(base_config);
  EXPECT_EQ(evalError("sram_estimate power -activity 1.5"),
            "activity factor 1.5 is not in [0, 1].");
  EXPECT_EQ(evalError("set_sram_default_activity -0.5"),
            "activity factor -0.5 is not in [0, 1].");
  evalError("sram_estimate power -activity");
  evalError("sram_estimate power -bogus 1");
  EXPECT_EQ(evalError("sram_estimate power -\xc3\xa9"),
            "unknown option -\xc3\xa9.");
}

TEST_F(SramTclCmdsTest, ModelRange) {
  evalOk("set_sram_config {depth 1024 width 32 banks 1 voltage 1.0 process_node 7"
         " power_gating false clock_gating false retention_mode false ecc_enable false}");
  EXPECT_EQ(evalError("sram_estimate timing"),
            "voltage 1 is outside the 7nm model range [0.6, 0.9].");
  // Area does not depend on voltage.
  evalOk("sram_estimate area");
}

TEST_F(SramTclCmdsTest, UnknownEstimate) {
  evalOk(base_config);
  evalError("sram_estimate leakage");
  evalError("sram_estimate");
}

TEST_F(SramTclCmdsTest, DefineProcessNode) {
  evalOk("define_sram_process_node 22 {bitcell_area 0.1 vmin 0.7 vmax 1.0"
         " vnom 0.85 vth 0.33 base_access 0.3 wire_delay 0.011"
         " drive_delay 0.18 setup_hold 0.11 column_cap 0.04 leakage_density 25}");
  EXPECT_EQ(evalOk("sram_process_nodes"), "180 130 90 65 45 28 22 16 7");
  evalOk("set_sram_config {depth 512 width 16 banks 2 voltage 0.85 process_node 22"
         " power_gating 0 clock_gating 0 retention_mode 0 ecc_enable 1}");
  EXPECT_EQ(evalOk("dict get [get_sram_config] code_width"), "22");
  evalError("define_sram_process_node 20 {bitcell_area 0.1}");
  evalError("define_sram_process_node 20 {bitcell_area x vmin 0.7 vmax 1.0"
            " vnom 0.85 vth 0.33 base_access 0.3 wire_delay 0.011"
            " drive_delay 0.18 setup_hold 0.11 column_cap 0.04 leakage_density 25}");
}

TEST_F(SramTclCmdsTest, ReportDigits) {
  evalOk("set_sram_report_digits 5");
  EXPECT_EQ(compiler_->variables()->reportDigits(), 5);
  evalError("set_sram_report_digits 20");
  evalError("set_sram_report_digits x");
}

TEST_F(SramTclCmdsTest, ThreadCount) {
  evalOk("set_sram_thread_count 2");
  EXPECT_EQ(compiler_->threadCount(), 2);
  evalOk("set_sram_thread_count max");
  EXPECT_GE(compiler_->threadCount(), 1);
  evalError("set_sram_thread_count 0");
}

TEST_F(SramTclCmdsTest, WriteVerilog) {
  evalOk("set_sram_config {depth 1024 width 32 banks 1 voltage 1.0 process_node 28"
         " power_gating false clock_gating false retention_mode false ecc_enable true}");
  char templ[] = "/tmp/sram_tcl_XXXXXX";
  ASSERT_NE(mkdtemp(templ), nullptr);
  std::string dir = templ;
  std::string cmd = "write_sram_verilog " + dir;
  EXPECT_EQ(evalOk(cmd.c_str()),
            "sram_1024x32_b1.v sram_1024x32_b1_ecc_enc.v sram_1024x32_b1_ecc_dec.v");
  const char *names[] = {"sram_1024x32_b1.v",
                         "sram_1024x32_b1_ecc_enc.v",
                         "sram_1024x32_b1_ecc_dec.v",
                         RtlGenerator::lock_filename};
  for (const char *name : names)
    unlink((dir + "/" + name).c_str());
  EXPECT_EQ(rmdir(dir.c_str()), 0);
}

TEST_F(SramTclCmdsTest, WrongArgs) {
  evalError("set_sram_config");
  evalError("set_sram_config {depth}");
  evalError("write_sram_verilog");
  evalError("report_sram_power_sweep {0.1 x}");
}

TEST_F(SramTclCmdsTest, EstimateErrorThenSuccess) {
  evalOk("set_sram_config {depth 1024 width 32 banks 1 voltage 1.0 process_node 7"
         " power_gating false clock_gating false retention_mode false ecc_enable false}");
  for (int i = 0; i < 3; i++)
    EXPECT_EQ(evalError("sram_estimate power"),
              "voltage 1 is outside the 7nm model range [0.6, 0.9].");
  evalOk("set_sram_config {depth 1024 width 32 banks 1 voltage 0.8 process_node 7"
         " power_gating false clock_gating false retention_mode false ecc_enable false}");
  EXPECT_EQ(evalOk("dict size [sram_estimate power]"), "6");
}

TEST_F(SramTclCmdsTest, NoCompiler) {
  SramCompiler::setSramCompiler(nullptr);
  EXPECT_EQ(evalError("sram_process_nodes"),
            "sram_process_nodes: no SRAM compiler.");
}

////////////////////////////////////////////////////////////////

class SramTemplatesTest : public SramTclCmdsTest {
protected:
  void SetUp() override {
    SramTclCmdsTest::SetUp();
    std::string cmd = std::string("source ") + SRAM_EXAMPLES_DIR + "/sram_configs.tcl";
    evalOk(cmd.c_str());
  }
};

TEST_F(SramTemplatesTest, Names) {
  EXPECT_EQ(evalOk("sram_template_names"),
            "ecc_2k high_perf_4k low_power_1k retention_8k");
  EXPECT_EQ(evalOk("dict get [sram_config_template ecc_2k] ecc_enable"), "1");
  EXPECT_EQ(evalError("sram_config_template bogus"),
            "unknown SRAM template bogus"
            " (ecc_2k, high_perf_4k, low_power_1k, retention_8k).");
}

TEST_F(SramTemplatesTest, UseTemplate) {
  EXPECT_EQ(evalOk("sram_use_template low_power_1k"), "sram_1024x32_b1");
  ASSERT_NE(compiler_->config(), nullptr);
  EXPECT_TRUE(compiler_->config()->powerGating());
  EXPECT_DOUBLE_EQ(compiler_->config()->voltage(), 0.8);

  evalOk("sram_use_template low_power_1k voltage 0.75 banks 2");
  EXPECT_DOUBLE_EQ(compiler_->config()->voltage(), 0.75);
  EXPECT_EQ(compiler_->config()->banks(), 2);

  EXPECT_EQ(evalError("sram_use_template low_power_1k voltage"),
            "sram_use_template: overrides must be field value pairs.");
  EXPECT_EQ(compiler_->config()->banks(), 2);
  evalError("sram_use_template low_power_1k depth_words 10");
}

TEST_F(SramTemplatesTest, EveryTemplateEstimates) {
  evalOk("report_sram_templates");
  for (const char *name : {"low_power_1k", "high_perf_4k", "ecc_2k", "retention_8k"}) {
    std::string cmd = std::string("sram_use_template ") + name;
    evalOk(cmd.c_str());
    EXPECT_EQ(evalOk("dict size [sram_estimate power]"), "6") << name;
  }
}

TEST_F(SramTemplatesTest, CompileTemplates) {
  char templ[] = "/tmp/sram_templates_XXXXXX";
  ASSERT_NE(mkdtemp(templ), nullptr);
  std::string dir = templ;
  std::string cmd = "compile_sram_templates " + dir + "/out";
  evalOk(cmd.c_str());
  std::string set_dir = "set dir " + dir + "/out";
  evalOk(set_dir.c_str());
  for (const char *name : {"low_power_1k", "high_perf_4k", "ecc_2k", "retention_8k"}) {
    std::string report = std::string("file size [file join $dir ") + name + "_report.txt]";
    EXPECT_NE(evalOk(report.c_str()), "0") << name;
    std::string rtl = std::string("llength [glob -directory [file join $dir ") + name + "] *.v]";
    EXPECT_NE(evalOk(rtl.c_str()), "0") << name;
  }
  EXPECT_EQ(evalOk("llength [glob -directory [file join $dir ecc_2k] *_ecc_enc.v]"), "1");
  EXPECT_EQ(evalOk("llength [glob -directory [file join $dir low_power_1k] *_pg.v]"), "1");
  EXPECT_EQ(evalOk("llength [glob -nocomplain -directory [file join $dir high_perf_4k] *_pg.v]"),
            "0");
  std::string remove = "file delete -force " + dir;
  evalOk(remove.c_str());
}

////////////////////////////////////////////////////////////////

// Report that runs out of memory printing.
class ReportOutOfMemory : public Report
{
protected:
  void printLine(const char *,
                 size_t) override
  {
    throw std::bad_alloc();
  }
};

class OutOfMemoryCompiler : public SramCompiler
{
protected:
  void makeReport() override
  {
    report_ = new ReportOutOfMemory;
  }
};

TEST(SramTclCmdsMemoryTest, OutOfMemoryIsTclError) {
  Tcl_FindExecutable(nullptr);
  Tcl_Interp *interp = Tcl_CreateInterp();
  OutOfMemoryCompiler compiler;
  compiler.makeComponents();
  SramCompiler::setSramCompiler(&compiler);
  ASSERT_EQ(Sram_Init(interp), TCL_OK);
  EXPECT_EQ(Tcl_Eval(interp, base_config), TCL_OK);
  EXPECT_EQ(Tcl_Eval(interp, "report_sram_config"), TCL_ERROR);
  EXPECT_STREQ(Tcl_GetStringResult(interp), "Error: out of memory.");
  // The interpreter is still usable.
  EXPECT_EQ(Tcl_Eval(interp, "sram_process_nodes"), TCL_OK);
  SramCompiler::setSramCompiler(nullptr);
  Tcl_DeleteInterp(interp);
}

} // namespace sram
