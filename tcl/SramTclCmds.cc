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

#include "SramTclCmds.hh"

#include <cctype>
#include <map>
#include <new>
#include <string>
#include <vector>

#include "SramBuildConfig.hh"
#include "Error.hh"
#include "Machine.hh"
#include "Report.hh"
#include "StringUtil.hh"
#include "Variables.hh"
#include "SramConfig.hh"
#include "SramCompiler.hh"
#include "TclTypeHelpers.hh"

namespace sram {

typedef int (*SramCmdFunc)(SramCompiler *compiler,
                           Tcl_Interp *interp,
                           int objc,
                           Tcl_Obj *const objv[]);

struct SramCmd
{
  const char *name;
  SramCmdFunc func;
};

typedef std::map<string, double> KeyValueMap;
typedef std::vector<Tcl_Obj*> TclObjSeq;

// Split objv into -key value options and positional args.
static int
parseKeyArgs(Tcl_Interp *interp,
             int objc,
             Tcl_Obj *const objv[],
             const StringSeq &keys,
             // Return values.
             KeyValueMap &key_values,
             TclObjSeq &args)
{
  for (int i = 1; i < objc; i++) {
    const char *arg = Tcl_GetString(objv[i]);
    bool is_key = false;
    for (const string &key : keys) {
      if (key == arg) {
        is_key = true;
        if (i + 1 >= objc) {
          tclArgError(interp, 1700, "%s requires a value.", arg);
          return TCL_ERROR;
        }
        double value;
        if (Tcl_GetDoubleFromObj(interp, objv[i + 1], &value) != TCL_OK)
          return TCL_ERROR;
        key_values[key] = value;
        i++;
        break;
      }
    }
    if (!is_key) {
      if (arg[0] == '-'
          && !isdigit(static_cast<unsigned char>(arg[1]))
          && arg[1] != '.') {
        tclArgError(interp, 1701, "unknown option %s.", arg);
        return TCL_ERROR;
      }
      args.push_back(objv[i]);
    }
  }
  return TCL_OK;
}

static double
keyValue(const KeyValueMap &key_values,
         const char *key,
         double default_value)
{
  auto itr = key_values.find(key);
  if (itr != key_values.end())
    return itr->second;
  return default_value;
}

////////////////////////////////////////////////////////////////

static int
setSramConfigCmd(SramCompiler *compiler,
                 Tcl_Interp *interp,
                 int objc,
                 Tcl_Obj *const objv[])
{
  if (objc != 2) {
    Tcl_WrongNumArgs(interp, 1, objv, "config_dict");
    return TCL_ERROR;
  }
  SramConfigValues values;
  if (tclDictStringMap(objv[1], interp, values) != TCL_OK)
    return TCL_ERROR;
  compiler->setConfig(values);
  Tcl_SetObjResult(interp,
                   Tcl_NewStringObj(compiler->config()->moduleName().c_str(), -1));
  return TCL_OK;
}

static int
getSramConfigCmd(SramCompiler *compiler,
                 Tcl_Interp *interp,
                 int objc,
                 Tcl_Obj *const objv[])
{
  if (objc != 1) {
    Tcl_WrongNumArgs(interp, 1, objv, "");
    return TCL_ERROR;
  }
  const SramConfig &config = compiler->ensureConfig();
  Tcl_Obj *dict = Tcl_NewDictObj();
  tclDictPutInt(interp, dict, "depth", config.depth());
  tclDictPutInt(interp, dict, "width", config.width());
  tclDictPutInt(interp, dict, "banks", config.banks());
  tclDictPutDouble(interp, dict, "voltage", config.voltage());
  tclDictPutInt(interp, dict, "process_node", config.processNode());
  tclDictPutInt(interp, dict, "power_gating", config.powerGating());
  tclDictPutInt(interp, dict, "clock_gating", config.clockGating());
  tclDictPutInt(interp, dict, "retention_mode", config.retentionMode());
  tclDictPutInt(interp, dict, "ecc_enable", config.eccEnable());
  tclDictPutInt(interp, dict, "address_width", config.addressWidth());
  tclDictPutInt(interp, dict, "words_per_bank", config.wordsPerBank());
  tclDictPutInt(interp, dict, "ecc_check_bits", config.eccCheckBits());
  tclDictPutInt(interp, dict, "code_width", config.codeWidth());
  tclDictPutString(interp, dict, "module_name", config.moduleName().c_str());
  tclDictPutString(interp, dict, "fingerprint", config.fingerprint().c_str());
  Tcl_SetObjResult(interp, dict);
  return TCL_OK;
}

static int
reportSramConfigCmd(SramCompiler *compiler,
                    Tcl_Interp *interp,
                    int objc,
                    Tcl_Obj *const objv[])
{
  if (objc != 1) {
    Tcl_WrongNumArgs(interp, 1, objv, "");
    return TCL_ERROR;
  }
  compiler->reportConfig();
  return TCL_OK;
}

static int
reportSramAreaCmd(SramCompiler *compiler,
                  Tcl_Interp *interp,
                  int objc,
                  Tcl_Obj *const objv[])
{
  if (objc != 1) {
    Tcl_WrongNumArgs(interp, 1, objv, "");
    return TCL_ERROR;
  }
  compiler->reportArea();
  return TCL_OK;
}

static int
reportSramTimingCmd(SramCompiler *compiler,
                    Tcl_Interp *interp,
                    int objc,
                    Tcl_Obj *const objv[])
{
  if (objc != 1) {
    Tcl_WrongNumArgs(interp, 1, objv, "");
    return TCL_ERROR;
  }
  compiler->reportTiming();
  return TCL_OK;
}

static int
reportSramPowerCmd(SramCompiler *compiler,
                   Tcl_Interp *interp,
                   int objc,
                   Tcl_Obj *const objv[])
{
  KeyValueMap key_values;
  TclObjSeq args;
  if (parseKeyArgs(interp, objc, objv, {"-activity", "-frequency"},
                   key_values, args) != TCL_OK)
    return TCL_ERROR;
  if (!args.empty()) {
    Tcl_WrongNumArgs(interp, 1, objv, "[-activity activity] [-frequency mhz]");
    return TCL_ERROR;
  }
  double activity = keyValue(key_values, "-activity",
                             compiler->variables()->defaultActivity());
  double frequency = keyValue(key_values, "-frequency", 0.0);
  compiler->reportPower(activity, frequency);
  return TCL_OK;
}

static int
reportSramPowerSweepCmd(SramCompiler *compiler,
                        Tcl_Interp *interp,
                        int objc,
                        Tcl_Obj *const objv[])
{
  if (objc > 2) {
    Tcl_WrongNumArgs(interp, 1, objv, "[activities]");
    return TCL_ERROR;
  }
  ActivitySeq activities;
  if (objc == 2) {
    if (tclListSeqDouble(objv[1], interp, activities) != TCL_OK)
      return TCL_ERROR;
  }
  else
    activities = SramCompiler::defaultSweepActivities();
  compiler->reportPowerSweep(activities);
  return TCL_OK;
}

static int
reportSramCmd(SramCompiler *compiler,
              Tcl_Interp *interp,
              int objc,
              Tcl_Obj *const objv[])
{
  KeyValueMap key_values;
  TclObjSeq args;
  if (parseKeyArgs(interp, objc, objv, {"-activity"}, key_values, args) != TCL_OK)
    return TCL_ERROR;
  if (!args.empty()) {
    Tcl_WrongNumArgs(interp, 1, objv, "[-activity activity]");
    return TCL_ERROR;
  }
  compiler->reportDesign(keyValue(key_values, "-activity",
                                  compiler->variables()->defaultActivity()));
  return TCL_OK;
}

static int
writeSramReportCmd(SramCompiler *compiler,
                   Tcl_Interp *interp,
                   int objc,
                   Tcl_Obj *const objv[])
{
  KeyValueMap key_values;
  TclObjSeq args;
  if (parseKeyArgs(interp, objc, objv, {"-activity"}, key_values, args) != TCL_OK)
    return TCL_ERROR;
  if (args.size() != 1) {
    Tcl_WrongNumArgs(interp, 1, objv, "[-activity activity] filename");
    return TCL_ERROR;
  }
  compiler->writeReport(Tcl_GetString(args[0]),
                        keyValue(key_values, "-activity",
                                 compiler->variables()->defaultActivity()));
  return TCL_OK;
}

static int
writeSramVerilogCmd(SramCompiler *compiler,
                    Tcl_Interp *interp,
                    int objc,
                    Tcl_Obj *const objv[])
{
  if (objc != 2) {
    Tcl_WrongNumArgs(interp, 1, objv, "dir");
    return TCL_ERROR;
  }
  StringSeq names = compiler->writeVerilog(Tcl_GetString(objv[1]));
  Tcl_Obj *list = Tcl_NewListObj(0, nullptr);
  for (const string &name : names)
    Tcl_ListObjAppendElement(interp, list, Tcl_NewStringObj(name.c_str(), -1));
  Tcl_SetObjResult(interp, list);
  return TCL_OK;
}

static int
sramEstimateCmd(SramCompiler *compiler,
                Tcl_Interp *interp,
                int objc,
                Tcl_Obj *const objv[])
{
  KeyValueMap key_values;
  TclObjSeq args;
  if (parseKeyArgs(interp, objc, objv, {"-activity", "-frequency"},
                   key_values, args) != TCL_OK)
    return TCL_ERROR;
  if (args.size() != 1) {
    Tcl_WrongNumArgs(interp, 1, objv,
                     "area|timing|power [-activity activity] [-frequency mhz]");
    return TCL_ERROR;
  }
  // Estimates can throw so the result dict is made after they return.
  const char *kind = Tcl_GetString(args[0]);
  Tcl_Obj *dict;
  if (stringEq(kind, "area")) {
    AreaEstimate area = compiler->area();
    dict = Tcl_NewDictObj();
    tclDictPutDouble(interp, dict, "bitcell_area_mm2", area.bitcell_area_mm2);
    tclDictPutDouble(interp, dict, "periphery_area_mm2", area.periphery_area_mm2);
    tclDictPutDouble(interp, dict, "bank_area_mm2", area.bank_area_mm2);
    tclDictPutDouble(interp, dict, "total_area_mm2", area.total_area_mm2);
    tclDictPutDouble(interp, dict, "area_efficiency", area.area_efficiency);
  }
  else if (stringEq(kind, "timing")) {
    TimingEstimate timing = compiler->timing();
    dict = Tcl_NewDictObj();
    tclDictPutDouble(interp, dict, "access_time_ns", timing.access_time_ns);
    tclDictPutDouble(interp, dict, "cycle_time_ns", timing.cycle_time_ns);
    tclDictPutDouble(interp, dict, "max_frequency_mhz", timing.max_frequency_mhz);
  }
  else if (stringEq(kind, "power")) {
    double activity = keyValue(key_values, "-activity",
                               compiler->variables()->defaultActivity());
    double frequency = keyValue(key_values, "-frequency", 0.0);
    PowerEstimate power = compiler->power(activity, frequency);
    dict = Tcl_NewDictObj();
    tclDictPutDouble(interp, dict, "activity_factor", power.activity_factor);
    tclDictPutDouble(interp, dict, "frequency_mhz", power.frequency_mhz);
    tclDictPutDouble(interp, dict, "dynamic_power_mw", power.dynamic_power_mw);
    tclDictPutDouble(interp, dict, "static_power_mw", power.static_power_mw);
    tclDictPutDouble(interp, dict, "total_power_mw", power.total_power_mw);
    tclDictPutDouble(interp, dict, "retention_power_uw", power.retention_power_uw);
  }
  else {
    tclArgError(interp, 1702, "unknown estimate %s, expected area, timing or power.",
                kind);
    return TCL_ERROR;
  }
  Tcl_SetObjResult(interp, dict);
  return TCL_OK;
}

static int
setSramDebugCmd(SramCompiler *compiler,
                Tcl_Interp *interp,
                int objc,
                Tcl_Obj *const objv[])
{
  if (objc != 3) {
    Tcl_WrongNumArgs(interp, 1, objv, "topic level");
    return TCL_ERROR;
  }
  int level;
  if (Tcl_GetIntFromObj(interp, objv[2], &level) != TCL_OK)
    return TCL_ERROR;
  compiler->setDebugLevel(Tcl_GetString(objv[1]), level);
  return TCL_OK;
}

static int
setSramDefaultActivityCmd(SramCompiler *compiler,
                          Tcl_Interp *interp,
                          int objc,
                          Tcl_Obj *const objv[])
{
  if (objc != 2) {
    Tcl_WrongNumArgs(interp, 1, objv, "activity");
    return TCL_ERROR;
  }
  double activity;
  if (Tcl_GetDoubleFromObj(interp, objv[1], &activity) != TCL_OK)
    return TCL_ERROR;
  compiler->variables()->setDefaultActivity(activity);
  return TCL_OK;
}

static int
setSramReportDigitsCmd(SramCompiler *compiler,
                       Tcl_Interp *interp,
                       int objc,
                       Tcl_Obj *const objv[])
{
  if (objc != 2) {
    Tcl_WrongNumArgs(interp, 1, objv, "digits");
    return TCL_ERROR;
  }
  int digits;
  if (Tcl_GetIntFromObj(interp, objv[1], &digits) != TCL_OK)
    return TCL_ERROR;
  if (digits < 0 || digits > 12) {
    tclArgError(interp, 1703, "report digits %s must be between 0 and 12.",
                Tcl_GetString(objv[1]));
    return TCL_ERROR;
  }
  compiler->variables()->setReportDigits(digits);
  return TCL_OK;
}

static int
setSramThreadCountCmd(SramCompiler *compiler,
                      Tcl_Interp *interp,
                      int objc,
                      Tcl_Obj *const objv[])
{
  if (objc != 2) {
    Tcl_WrongNumArgs(interp, 1, objv, "count|max");
    return TCL_ERROR;
  }
  const char *arg = Tcl_GetString(objv[1]);
  int thread_count;
  if (stringEqual(arg, "max"))
    thread_count = processorCount();
  else if (Tcl_GetIntFromObj(interp, objv[1], &thread_count) != TCL_OK)
    return TCL_ERROR;
  compiler->setThreadCount(thread_count);
  return TCL_OK;
}

static const char *process_node_keys[] = {
  "bitcell_area",
  "vmin",
  "vmax",
  "vnom",
  "vth",
  "base_access",
  "wire_delay",
  "drive_delay",
  "setup_hold",
  "column_cap",
  "leakage_density",
};

static int
defineSramProcessNodeCmd(SramCompiler *compiler,
                         Tcl_Interp *interp,
                         int objc,
                         Tcl_Obj *const objv[])
{
  if (objc != 3) {
    Tcl_WrongNumArgs(interp, 1, objv, "node constants_dict");
    return TCL_ERROR;
  }
  int node;
  if (Tcl_GetIntFromObj(interp, objv[1], &node) != TCL_OK)
    return TCL_ERROR;
  std::map<string, string> values;
  if (tclDictStringMap(objv[2], interp, values) != TCL_OK)
    return TCL_ERROR;
  for (const auto &key_value : values) {
    bool known = false;
    for (const char *key : process_node_keys) {
      if (key_value.first == key)
        known = true;
    }
    if (!known)
      throw ConfigurationError(key_value.first.c_str(), key_value.second.c_str(),
                               "is not a process node constant");
  }
  std::map<string, double> constants;
  for (const char *key : process_node_keys) {
    auto itr = values.find(key);
    if (itr == values.end())
      throw ConfigurationError(key, nullptr, "is missing");
    Tcl_Obj *value_obj = Tcl_NewStringObj(itr->second.c_str(), -1);
    Tcl_IncrRefCount(value_obj);
    double value;
    int result = Tcl_GetDoubleFromObj(nullptr, value_obj, &value);
    Tcl_DecrRefCount(value_obj);
    if (result != TCL_OK)
      throw ConfigurationError(key, itr->second.c_str(), "is not a number");
    constants[key] = value;
  }
  compiler->defineProcessNode(ProcessNode(node,
                                          constants["bitcell_area"],
                                          constants["vmin"],
                                          constants["vmax"],
                                          constants["vnom"],
                                          constants["vth"],
                                          constants["base_access"],
                                          constants["wire_delay"],
                                          constants["drive_delay"],
                                          constants["setup_hold"],
                                          constants["column_cap"],
                                          constants["leakage_density"]));
  return TCL_OK;
}

static int
sramProcessNodesCmd(SramCompiler *compiler,
                    Tcl_Interp *interp,
                    int objc,
                    Tcl_Obj *const objv[])
{
  if (objc != 1) {
    Tcl_WrongNumArgs(interp, 1, objv, "");
    return TCL_ERROR;
  }
  Tcl_Obj *list = Tcl_NewListObj(0, nullptr);
  for (int node : compiler->processTable()->nodes())
    Tcl_ListObjAppendElement(interp, list, Tcl_NewIntObj(node));
  Tcl_SetObjResult(interp, list);
  return TCL_OK;
}

static int
logBeginCmd(SramCompiler *compiler,
            Tcl_Interp *interp,
            int objc,
            Tcl_Obj *const objv[])
{
  if (objc != 2) {
    Tcl_WrongNumArgs(interp, 1, objv, "filename");
    return TCL_ERROR;
  }
  compiler->report()->logBegin(Tcl_GetString(objv[1]));
  return TCL_OK;
}

static int
logEndCmd(SramCompiler *compiler,
          Tcl_Interp *interp,
          int objc,
          Tcl_Obj *const objv[])
{
  if (objc != 1) {
    Tcl_WrongNumArgs(interp, 1, objv, "");
    return TCL_ERROR;
  }
  compiler->report()->logEnd();
  return TCL_OK;
}

static int
sramVersionCmd(SramCompiler *,
               Tcl_Interp *interp,
               int objc,
               Tcl_Obj *const objv[])
{
  if (objc != 1) {
    Tcl_WrongNumArgs(interp, 1, objv, "");
    return TCL_ERROR;
  }
  Tcl_SetObjResult(interp, Tcl_NewStringObj(SRAM_VERSION, -1));
  return TCL_OK;
}

static const SramCmd sram_cmds[] = {
  {"set_sram_config", setSramConfigCmd},
  {"get_sram_config", getSramConfigCmd},
  {"report_sram_config", reportSramConfigCmd},
  {"report_sram_area", reportSramAreaCmd},
  {"report_sram_timing", reportSramTimingCmd},
  {"report_sram_power", reportSramPowerCmd},
  {"report_sram_power_sweep", reportSramPowerSweepCmd},
  {"report_sram", reportSramCmd},
  {"write_sram_report", writeSramReportCmd},
  {"write_sram_verilog", writeSramVerilogCmd},
  {"sram_estimate", sramEstimateCmd},
  {"set_sram_debug", setSramDebugCmd},
  {"set_sram_default_activity", setSramDefaultActivityCmd},
  {"set_sram_report_digits", setSramReportDigitsCmd},
  {"set_sram_thread_count", setSramThreadCountCmd},
  {"define_sram_process_node", defineSramProcessNodeCmd},
  {"sram_process_nodes", sramProcessNodesCmd},
  {"log_begin", logBeginCmd},
  {"log_end", logEndCmd},
  {"sram_version", sramVersionCmd},
};

// Errors thrown by the compiler become tcl errors.
static int
sramCmdProc(ClientData client_data,
            Tcl_Interp *interp,
            int objc,
            Tcl_Obj *const objv[])
{
  const SramCmd *cmd = static_cast<const SramCmd*>(client_data);
  SramCompiler *compiler = SramCompiler::sramCompiler();
  if (compiler == nullptr) {
    tclArgError(interp, 1704, "%s: no SRAM compiler.", cmd->name);
    return TCL_ERROR;
  }
  try {
    return cmd->func(compiler, interp, objc, objv);
  }
  catch (const Exception &error) {
    Tcl_SetObjResult(interp, Tcl_NewStringObj(error.what(), -1));
    return TCL_ERROR;
  }
  catch (const std::bad_alloc &) {
    Tcl_SetObjResult(interp, Tcl_NewStringObj("Error: out of memory.", -1));
    return TCL_ERROR;
  }
}

int
Sram_Init(Tcl_Interp *interp)
{
  if (Tcl_Eval(interp, "namespace eval ::sram {}") != TCL_OK)
    return TCL_ERROR;
  for (const SramCmd &cmd : sram_cmds) {
    string name = stdstrPrint("::sram::%s", cmd.name);
    Tcl_CreateObjCommand(interp, name.c_str(), sramCmdProc,
                         const_cast<SramCmd*>(&cmd), nullptr);
  }
  return Tcl_Eval(interp,
                  "namespace eval ::sram { namespace export * }\n"
                  "namespace import -force ::sram::*");
}

} // namespace sram
