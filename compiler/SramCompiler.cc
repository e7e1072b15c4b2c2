// SramCompiler, SRAM Macro Compiler
// Copyright (c) 2025, Parallax Software, Inc.
// 
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
// 
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
// GNU General Public License for more details.
// 
// You should have received a copy of the GNU General Public License
// along with this program. If not, see <https://www.gnu.org/licenses/>.
// 
// The origin of this software must not be misrepresented; you must not
// claim that you wrote the original software.
// 
// Altered source versions must be plainly marked as such, and must not be
// misrepresented as being the original software.
// 
// This notice may not be removed or altered from any source distribution.

#include "SramCompiler.hh"

#include <exception>

#include "Report.hh"
#include "ReportTcl.hh"
#include "Debug.hh"
#include "Error.hh"
#include "ThreadForEach.hh"
#include "Variables.hh"
#include "FeatureTable.hh"
#include "AreaModel.hh"
#include "TimingModel.hh"
#include "PowerModel.hh"
#include "RtlGenerator.hh"
#include "ReportSram.hh"

namespace sram {

SramCompiler *SramCompiler::sram_compiler_ = nullptr;

SramCompiler *
SramCompiler::sramCompiler()
{
  return sram_compiler_;
}

void
SramCompiler::setSramCompiler(SramCompiler *compiler)
{
  sram_compiler_ = compiler;
}

SramCompiler::SramCompiler() :
  SramState(),
  thread_count_(1),
  area_model_(nullptr),
  timing_model_(nullptr),
  power_model_(nullptr),
  rtl_generator_(nullptr),
  report_sram_(nullptr),
  features_(nullptr)
{
}

SramCompiler::~SramCompiler()
{
  // Delete "top down" to minimize chance of referencing deleted memory.
  delete report_sram_;
  delete rtl_generator_;
  delete power_model_;
  delete timing_model_;
  delete area_model_;
  delete features_;
  delete process_table_;
  delete variables_;
  delete debug_;
  delete report_;
}

void
SramCompiler::makeComponents()
{
  makeReport();
  makeDebug();
  variables_ = new Variables;
  process_table_ = new ProcessTable;
  features_ = new FeatureTable;
  feature_table_ = features_;
  makeModels();
}

void
SramCompiler::makeReport()
{
  report_ = new ReportTcl();
}

void
SramCompiler::makeDebug()
{
  debug_ = new Debug(report_);
}

void
SramCompiler::makeModels()
{
  area_model_ = new AreaModel(this);
  timing_model_ = new TimingModel(this);
  power_model_ = new PowerModel(this);
  rtl_generator_ = new RtlGenerator(this);
  report_sram_ = new ReportSram(this);
}

void
SramCompiler::setThreadCount(int thread_count)
{
  if (thread_count < 1)
    report_->error(1600, "thread count %d must be at least 1.", thread_count);
  thread_count_ = thread_count;
}

////////////////////////////////////////////////////////////////

void
SramCompiler::setConfig(const SramConfigValues &values)
{
  setConfig(parseSramConfigValues(values));
}

void
SramCompiler::setConfig(const SramConfigFields &fields)
{
  std::unique_ptr<SramConfig> config(new SramConfig(fields, process_table_));
  int depth = config->depth();
  if ((depth & (depth - 1)) != 0)
    report_->warn(1601, "depth %d is not a power of two.", depth);
  debugPrint(debug_, "config", 1, "%s fingerprint %s",
             config->moduleName().c_str(),
             config->fingerprint().c_str());
  config_ = std::move(config);
}

const SramConfig &
SramCompiler::ensureConfig() const
{
  if (config_ == nullptr)
    report_->error(1602, "no SRAM configuration. Use set_sram_config.");
  return *config_;
}

void
SramCompiler::defineProcessNode(const ProcessNode &node)
{
  process_table_->defineNode(node);
}

void
SramCompiler::setDebugLevel(const char *what,
                            int level)
{
  debug_->setLevel(what, level);
}

////////////////////////////////////////////////////////////////

AreaEstimate
SramCompiler::area() const
{
  return area_model_->area(ensureConfig());
}

TimingEstimate
SramCompiler::timing() const
{
  return timing_model_->timing(ensureConfig());
}

PowerEstimate
SramCompiler::power() const
{
  return power_model_->power(ensureConfig());
}

PowerEstimate
SramCompiler::power(double activity,
                    double frequency_mhz) const
{
  return power_model_->power(ensureConfig(), activity, frequency_mhz);
}

PowerEstimateSeq
SramCompiler::powerSweep(const ActivitySeq &activities,
                         double frequency_mhz) const
{
  const SramConfig &config = ensureConfig();
  for (double activity : activities) {
    if (!(activity >= 0.0 && activity <= 1.0))
      throw InvalidActivityFactorError(activity);
  }
  size_t count = activities.size();
  PowerEstimateSeq powers(count);
  std::vector<std::exception_ptr> errors(count);
  forEach(count, [&](size_t i) {
    try {
      powers[i] = power_model_->power(config, activities[i], frequency_mhz);
    }
    catch (...) {
      // Rethrown by the calling thread.
      errors[i] = std::current_exception();
    }
  }, thread_count_);
  for (const std::exception_ptr &error : errors) {
    if (error)
      std::rethrow_exception(error);
  }
  return powers;
}

const ActivitySeq &
SramCompiler::defaultSweepActivities()
{
  static const ActivitySeq activities = {0.01, 0.05, 0.1, 0.2, 0.5};
  return activities;
}

StringSeq
SramCompiler::writeVerilog(const char *dir) const
{
  return rtl_generator_->generate(ensureConfig(), dir);
}

////////////////////////////////////////////////////////////////

void
SramCompiler::reportConfig()
{
  report_sram_->reportConfig(ensureConfig(), variables_->reportDigits());
}

void
SramCompiler::reportArea()
{
  report_sram_->reportArea(area(), variables_->reportDigits());
}

void
SramCompiler::reportTiming()
{
  report_sram_->reportTiming(timing(), variables_->reportDigits());
}

void
SramCompiler::reportPower(double activity,
                          double frequency_mhz)
{
  report_sram_->reportPower(ensureConfig(),
                            power(activity, frequency_mhz),
                            variables_->reportDigits());
}

void
SramCompiler::reportPowerSweep(const ActivitySeq &activities)
{
  report_sram_->reportPowerSweep(powerSweep(activities),
                                 variables_->reportDigits());
}

void
SramCompiler::reportDesign(double activity)
{
  const SramConfig &config = ensureConfig();
  int digits = variables_->reportDigits();
  // Estimate everything before printing so errors leave no partial report.
  AreaEstimate area_estimate = area();
  TimingEstimate timing_estimate = timing();
  PowerEstimate power_estimate = power(activity, 0.0);
  PowerEstimateSeq sweep = powerSweep(defaultSweepActivities());
  report_sram_->reportConfig(config, digits);
  report_->reportBlankLine();
  report_sram_->reportArea(area_estimate, digits);
  report_->reportBlankLine();
  report_sram_->reportTiming(timing_estimate, digits);
  report_->reportBlankLine();
  report_sram_->reportPower(config, power_estimate, digits);
  report_->reportBlankLine();
  report_sram_->reportPowerSweep(sweep, digits);
}

void
SramCompiler::writeReport(const char *filename,
                          double activity)
{
  ensureConfig();
  report_->redirectFileBegin(filename);
  try {
    reportDesign(activity);
  }
  catch (...) {
    report_->redirectFileEnd();
    throw;
  }
  report_->redirectFileEnd();
}

} // namespace sram
