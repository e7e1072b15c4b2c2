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

#pragma once

#include <memory>
#include <vector>

#include "EstimateClass.hh"
#include "SramState.hh"
#include "SramConfig.hh"
#include "StringUtil.hh"

namespace sram {

class AreaModel;
class TimingModel;
class PowerModel;
class RtlGenerator;
class ReportSram;

typedef std::vector<double> ActivitySeq;
typedef std::vector<PowerEstimate> PowerEstimateSeq;

// Top level entry point used by the command interpreter.
// Owns the shared components and the current configuration.
class SramCompiler : public SramState
{
public:
  SramCompiler();
  virtual ~SramCompiler();
  // Singleton used by the tcl commands.
  static SramCompiler *sramCompiler();
  static void setSramCompiler(SramCompiler *compiler);
  virtual void makeComponents();

  void setThreadCount(int thread_count);
  int threadCount() const { return thread_count_; }

  // Throws ConfigurationError and keeps the previous configuration.
  void setConfig(const SramConfigValues &values);
  void setConfig(const SramConfigFields &fields);
  // nullptr before setConfig.
  const SramConfig *config() const { return config_.get(); }
  // Report::error if there is no configuration.
  const SramConfig &ensureConfig() const;
  void defineProcessNode(const ProcessNode &node);
  void setDebugLevel(const char *what,
                     int level);

  AreaEstimate area() const;
  TimingEstimate timing() const;
  // Variables default activity at the max frequency.
  PowerEstimate power() const;
  PowerEstimate power(double activity,
                      double frequency_mhz) const;
  // Estimates in the order of activities, evaluated on threadCount()
  // threads.  Throws InvalidActivityFactorError before evaluating any
  // estimate if an activity is not in [0, 1].
  PowerEstimateSeq powerSweep(const ActivitySeq &activities,
                              double frequency_mhz = 0.0) const;
  // Return the artifact names written in dir.
  StringSeq writeVerilog(const char *dir) const;

  void reportConfig();
  void reportArea();
  void reportTiming();
  void reportPower(double activity,
                   double frequency_mhz);
  void reportPowerSweep(const ActivitySeq &activities);
  // Configuration and all estimates.
  void reportDesign(double activity);
  // reportDesign redirected to filename.
  void writeReport(const char *filename,
                   double activity);

  static const ActivitySeq &defaultSweepActivities();

protected:
  virtual void makeReport();
  virtual void makeDebug();
  void makeModels();

  std::unique_ptr<SramConfig> config_;
  int thread_count_;
  AreaModel *area_model_;
  TimingModel *timing_model_;
  PowerModel *power_model_;
  RtlGenerator *rtl_generator_;
  ReportSram *report_sram_;
  FeatureTable *features_;

  static SramCompiler *sram_compiler_;
};

} // namespace sram
