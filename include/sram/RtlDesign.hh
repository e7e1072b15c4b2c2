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
#include <string>
#include <vector>

#include "EnumNameMap.hh"
#include "StringUtil.hh"
#include "SramConfig.hh"

namespace sram {

using std::string;

enum class RtlPortDir { input, output };

enum class RtlModuleKind { memory, clock_gate, ecc_encoder, ecc_decoder, power_gate };

extern EnumNameMap<RtlModuleKind> rtl_module_kind_names;

const char *
rtlModuleKindName(RtlModuleKind kind);

// Module parameter or instance parameter override.
struct RtlParam
{
  string name;
  string value;
};

// Port or internal net.
// A non-empty width_param renders as [width_param-1:0].
class RtlNet
{
public:
  RtlNet(const char *name,
         int width,
         const char *width_param = "",
         bool is_reg = false);
  const string &name() const { return name_; }
  int width() const { return width_; }
  const string &widthParam() const { return width_param_; }
  bool isBus() const;
  // Driven from an always block.
  bool isReg() const { return is_reg_; }

protected:
  string name_;
  int width_;
  string width_param_;
  bool is_reg_;
};

class RtlPort : public RtlNet
{
public:
  RtlPort(const char *name,
          RtlPortDir dir,
          int width,
          const char *width_param = "");
  RtlPortDir dir() const { return dir_; }

private:
  RtlPortDir dir_;
};

// Instance port to net connection.
struct RtlConnection
{
  string port;
  string net;
};

typedef std::vector<RtlParam> RtlParamSeq;
typedef std::vector<RtlNet> RtlNetSeq;
typedef std::vector<RtlPort> RtlPortSeq;
typedef std::vector<RtlConnection> RtlConnectionSeq;

class RtlInstance
{
public:
  RtlInstance(const string &module_name,
              const char *name);
  const string &moduleName() const { return module_name_; }
  const string &name() const { return name_; }
  const RtlParamSeq &params() const { return params_; }
  const RtlConnectionSeq &connections() const { return connections_; }
  void addParam(const char *name,
                const char *value);
  void connect(const char *port,
               const char *net);
  // nullptr if port is not connected.
  const char *findNet(const char *port) const;

private:
  string module_name_;
  string name_;
  RtlParamSeq params_;
  RtlConnectionSeq connections_;
};

typedef std::vector<RtlInstance> RtlInstanceSeq;

// Interface and hierarchy of one generated module.
class RtlModule
{
public:
  RtlModule(RtlModuleKind kind,
            const string &name);
  RtlModuleKind kind() const { return kind_; }
  const string &name() const { return name_; }
  // <name>.v
  string artifactName() const;
  const RtlParamSeq &params() const { return params_; }
  const RtlPortSeq &ports() const { return ports_; }
  const RtlNetSeq &nets() const { return nets_; }
  const RtlInstanceSeq &instances() const { return instances_; }
  const RtlPort *findPort(const char *name) const;
  const RtlParam *findParam(const char *name) const;
  const RtlInstance *findInstance(const char *name) const;
  void addParam(const char *name,
                int value);
  void addPort(const RtlPort &port);
  void addNet(const RtlNet &net);
  RtlInstance &addInstance(const RtlInstance &inst);

private:
  RtlModuleKind kind_;
  string name_;
  RtlParamSeq params_;
  RtlPortSeq ports_;
  RtlNetSeq nets_;
  RtlInstanceSeq instances_;
};

typedef std::vector<RtlModule> RtlModuleSeq;
typedef std::vector<int> IntSeq;

// Systematic extended Hamming (SEC-DED) code.
// Codeword bits are {parity, check[check_bits-1:0], data[data_bits-1:0]}.
class EccCode
{
public:
  explicit EccCode(int data_bits);
  int dataBits() const { return data_bits_; }
  // Hamming check bits, excluding the overall parity bit.
  int checkBits() const { return check_bits_; }
  int codeBits() const { return data_bits_ + check_bits_ + 1; }
  // Hamming position of data bit.  Powers of two are check positions.
  int dataPosition(int data_bit) const { return data_positions_[data_bit]; }
  // Data bits covered by check bit.
  const IntSeq &parityGroup(int check_bit) const { return parity_groups_[check_bit]; }
  // Codeword index of check bit.
  int checkIndex(int check_bit) const { return data_bits_ + check_bit; }
  int parityIndex() const { return data_bits_ + check_bits_; }

private:
  int data_bits_;
  int check_bits_;
  IntSeq data_positions_;
  std::vector<IntSeq> parity_groups_;
};

// Modules and ports generated for a configuration.
// Module order is fixed: memory, clock gate, ecc encoder, ecc decoder,
// power gate wrapper.
class RtlDesign
{
public:
  explicit RtlDesign(const SramConfig &config);
  const SramConfig &config() const { return config_; }
  const RtlModuleSeq &modules() const { return modules_; }
  // nullptr if the configuration does not need kind.
  const RtlModule *findModule(RtlModuleKind kind) const;
  // Power gate wrapper if there is one, else the memory.
  const RtlModule *top() const;
  // nullptr without ecc.
  const EccCode *eccCode() const { return ecc_code_.get(); }
  StringSeq artifactNames() const;
  // Module name of kind for this configuration whether or not it is
  // generated.
  string moduleName(RtlModuleKind kind) const;
  // Artifact names of every module kind of the configuration base name.
  StringSeq possibleArtifactNames() const;

private:
  void makeMemory();
  void makeClockGate();
  void makeEccEncoder();
  void makeEccDecoder();
  void makePowerGate();
  void addMemoryParams(RtlModule &module) const;
  void addMemoryPorts(RtlModule &module,
                      bool pwr_en_port) const;

  SramConfig config_;
  RtlModuleSeq modules_;
  std::unique_ptr<EccCode> ecc_code_;
};

} // namespace sram
