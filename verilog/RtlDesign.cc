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

#include "RtlDesign.hh"


namespace sram {

EnumNameMap<RtlModuleKind> rtl_module_kind_names =
  {{RtlModuleKind::memory, "memory"},
   {RtlModuleKind::clock_gate, "clk_gate"},
   {RtlModuleKind::ecc_encoder, "ecc_enc"},
   {RtlModuleKind::ecc_decoder, "ecc_dec"},
   {RtlModuleKind::power_gate, "pg"}};

const char *
rtlModuleKindName(RtlModuleKind kind)
{
  return rtl_module_kind_names.find(kind);
}

RtlNet::RtlNet(const char *name,
               int width,
               const char *width_param,
               bool is_reg) :
  name_(name),
  width_(width),
  width_param_(width_param),
  is_reg_(is_reg)
{
}

bool
RtlNet::isBus() const
{
  return width_ > 1 || !width_param_.empty();
}

RtlPort::RtlPort(const char *name,
                 RtlPortDir dir,
                 int width,
                 const char *width_param) :
  RtlNet(name, width, width_param),
  dir_(dir)
{
}

////////////////////////////////////////////////////////////////

RtlInstance::RtlInstance(const string &module_name,
                         const char *name) :
  module_name_(module_name),
  name_(name)
{
}

void
RtlInstance::addParam(const char *name,
                      const char *value)
{
  params_.push_back({name, value});
}

void
RtlInstance::connect(const char *port,
                     const char *net)
{
  connections_.push_back({port, net});
}

const char *
RtlInstance::findNet(const char *port) const
{
  for (const RtlConnection &connection : connections_) {
    if (connection.port == port)
      return connection.net.c_str();
  }
  return nullptr;
}

////////////////////////////////////////////////////////////////

RtlModule::RtlModule(RtlModuleKind kind,
                     const string &name) :
  kind_(kind),
  name_(name)
{
}

string
RtlModule::artifactName() const
{
  return name_ + ".v";
}

const RtlPort *
RtlModule::findPort(const char *name) const
{
  for (const RtlPort &port : ports_) {
    if (port.name() == name)
      return &port;
  }
  return nullptr;
}

const RtlParam *
RtlModule::findParam(const char *name) const
{
  for (const RtlParam &param : params_) {
    if (param.name == name)
      return &param;
  }
  return nullptr;
}

const RtlInstance *
RtlModule::findInstance(const char *name) const
{
  for (const RtlInstance &inst : instances_) {
    if (inst.name() == name)
      return &inst;
  }
  return nullptr;
}

void
RtlModule::addParam(const char *name,
                    int value)
{
  params_.push_back({name, std::to_string(value)});
}

void
RtlModule::addPort(const RtlPort &port)
{
  ports_.push_back(port);
}

void
RtlModule::addNet(const RtlNet &net)
{
  nets_.push_back(net);
}

RtlInstance &
RtlModule::addInstance(const RtlInstance &inst)
{
  instances_.push_back(inst);
  return instances_.back();
}

////////////////////////////////////////////////////////////////

EccCode::EccCode(int data_bits) :
  data_bits_(data_bits),
  check_bits_(hammingCheckBits(data_bits)),
  parity_groups_(check_bits_)
{
  int position = 1;
  for (int bit = 0; bit < data_bits_; bit++) {
    position++;
    // Skip check bit positions.
    while ((position & (position - 1)) == 0)
      position++;
    data_positions_.push_back(position);
    for (int check = 0; check < check_bits_; check++) {
      if (position & (1 << check))
        parity_groups_[check].push_back(bit);
    }
  }
}

////////////////////////////////////////////////////////////////

RtlDesign::RtlDesign(const SramConfig &config) :
  config_(config)
{
  makeMemory();
  if (config_.clockGating())
    makeClockGate();
  if (config_.eccEnable()) {
    ecc_code_ = std::make_unique<EccCode>(config_.width());
    makeEccEncoder();
    makeEccDecoder();
  }
  if (config_.powerGating())
    makePowerGate();
}

string
RtlDesign::moduleName(RtlModuleKind kind) const
{
  if (kind == RtlModuleKind::memory)
    return config_.moduleName();
  else
    return config_.moduleName() + "_" + rtlModuleKindName(kind);
}

void
RtlDesign::addMemoryParams(RtlModule &module) const
{
  module.addParam("ADDR_WIDTH", config_.addressWidth());
  module.addParam("DATA_WIDTH", config_.width());
  module.addParam("CODE_WIDTH", config_.codeWidth());
  module.addParam("BANKS", config_.banks());
  module.addParam("WORDS_PER_BANK", config_.wordsPerBank());
  module.addParam("DEPTH", config_.depth());
}

void
RtlDesign::addMemoryPorts(RtlModule &module,
                          bool pwr_en_port) const
{
  module.addPort(RtlPort("clk", RtlPortDir::input, 1));
  module.addPort(RtlPort("ce", RtlPortDir::input, 1));
  module.addPort(RtlPort("we", RtlPortDir::input, 1));
  module.addPort(RtlPort("addr", RtlPortDir::input,
                         config_.addressWidth(), "ADDR_WIDTH"));
  module.addPort(RtlPort("wdata", RtlPortDir::input,
                         config_.width(), "DATA_WIDTH"));
  module.addPort(RtlPort("rdata", RtlPortDir::output,
                         config_.width(), "DATA_WIDTH"));
  if (config_.retentionMode())
    module.addPort(RtlPort("ret_en", RtlPortDir::input, 1));
  if (pwr_en_port)
    module.addPort(RtlPort("pwr_en", RtlPortDir::input,
                           config_.banks(), "BANKS"));
  if (config_.eccEnable()) {
    module.addPort(RtlPort("ecc_correctable", RtlPortDir::output, 1));
    module.addPort(RtlPort("ecc_uncorrectable", RtlPortDir::output, 1));
  }
}

void
RtlDesign::makeMemory()
{
  RtlModule module(RtlModuleKind::memory, moduleName(RtlModuleKind::memory));
  addMemoryParams(module);
  addMemoryPorts(module, config_.powerGating());

  int code_width = config_.codeWidth();
  int banks = config_.banks();
  int addr_width = config_.addressWidth();
  module.addNet(RtlNet("access_en", 1));
  module.addNet(RtlNet("array_clk", 1));
  module.addNet(RtlNet("bank_index", addr_width, "ADDR_WIDTH"));
  module.addNet(RtlNet("word_addr", addr_width, "ADDR_WIDTH"));
  module.addNet(RtlNet("bank_sel", banks, "BANKS"));
  module.addNet(RtlNet("wcode", code_width, "CODE_WIDTH"));
  module.addNet(RtlNet("rcode", code_width, "CODE_WIDTH"));
  module.addNet(RtlNet("bank_rcode", banks * code_width, "BANKS*CODE_WIDTH"));
  module.addNet(RtlNet("rd_bank", addr_width, "ADDR_WIDTH", true));

  if (config_.clockGating()) {
    RtlInstance &gate = module.addInstance(RtlInstance(moduleName(RtlModuleKind::clock_gate),
                                                       "clk_gate"));
    gate.connect("clk", "clk");
    gate.connect("en", "access_en");
    gate.connect("gclk", "array_clk");
  }
  if (config_.eccEnable()) {
    RtlInstance &enc = module.addInstance(RtlInstance(moduleName(RtlModuleKind::ecc_encoder),
                                                      "ecc_enc"));
    enc.connect("data_in", "wdata");
    enc.connect("code_out", "wcode");
    RtlInstance &dec = module.addInstance(RtlInstance(moduleName(RtlModuleKind::ecc_decoder),
                                                      "ecc_dec"));
    dec.connect("code_in", "rcode");
    dec.connect("data_out", "rdata");
    dec.connect("correctable", "ecc_correctable");
    dec.connect("uncorrectable", "ecc_uncorrectable");
  }
  modules_.push_back(module);
}

void
RtlDesign::makeClockGate()
{
  RtlModule module(RtlModuleKind::clock_gate,
                   moduleName(RtlModuleKind::clock_gate));
  module.addPort(RtlPort("clk", RtlPortDir::input, 1));
  module.addPort(RtlPort("en", RtlPortDir::input, 1));
  module.addPort(RtlPort("gclk", RtlPortDir::output, 1));
  module.addNet(RtlNet("en_latch", 1, "", true));
  modules_.push_back(module);
}

void
RtlDesign::makeEccEncoder()
{
  RtlModule module(RtlModuleKind::ecc_encoder,
                   moduleName(RtlModuleKind::ecc_encoder));
  module.addParam("DATA_WIDTH", config_.width());
  module.addParam("CODE_WIDTH", config_.codeWidth());
  module.addPort(RtlPort("data_in", RtlPortDir::input,
                         config_.width(), "DATA_WIDTH"));
  module.addPort(RtlPort("code_out", RtlPortDir::output,
                         config_.codeWidth(), "CODE_WIDTH"));
  module.addNet(RtlNet("check", ecc_code_->checkBits(), "CHECK_BITS"));
  module.addParam("CHECK_BITS", ecc_code_->checkBits());
  modules_.push_back(module);
}

void
RtlDesign::makeEccDecoder()
{
  RtlModule module(RtlModuleKind::ecc_decoder,
                   moduleName(RtlModuleKind::ecc_decoder));
  module.addParam("DATA_WIDTH", config_.width());
  module.addParam("CODE_WIDTH", config_.codeWidth());
  module.addParam("CHECK_BITS", ecc_code_->checkBits());
  module.addPort(RtlPort("code_in", RtlPortDir::input,
                         config_.codeWidth(), "CODE_WIDTH"));
  module.addPort(RtlPort("data_out", RtlPortDir::output,
                         config_.width(), "DATA_WIDTH"));
  module.addPort(RtlPort("correctable", RtlPortDir::output, 1));
  module.addPort(RtlPort("uncorrectable", RtlPortDir::output, 1));
  module.addNet(RtlNet("syndrome", ecc_code_->checkBits(), "CHECK_BITS"));
  module.addNet(RtlNet("parity_err", 1));
  modules_.push_back(module);
}

void
RtlDesign::makePowerGate()
{
  RtlModule module(RtlModuleKind::power_gate,
                   moduleName(RtlModuleKind::power_gate));
  addMemoryParams(module);
  addMemoryPorts(module, false);
  module.addPort(RtlPort("sleep", RtlPortDir::input, 1));
  module.addNet(RtlNet("access_req", 1));
  module.addNet(RtlNet("bank_index", config_.addressWidth(), "ADDR_WIDTH"));
  module.addNet(RtlNet("pwr_en", config_.banks(), "BANKS"));

  RtlInstance &mem = module.addInstance(RtlInstance(moduleName(RtlModuleKind::memory),
                                                    "mem"));
  for (const RtlParam &param : module.params())
    mem.addParam(param.name.c_str(), param.name.c_str());
  for (const RtlPort &port : module.ports()) {
    if (port.name() != "sleep")
      mem.connect(port.name().c_str(), port.name().c_str());
  }
  mem.connect("pwr_en", "pwr_en");
  modules_.push_back(module);
}

const RtlModule *
RtlDesign::findModule(RtlModuleKind kind) const
{
  for (const RtlModule &module : modules_) {
    if (module.kind() == kind)
      return &module;
  }
  return nullptr;
}

const RtlModule *
RtlDesign::top() const
{
  const RtlModule *pg = findModule(RtlModuleKind::power_gate);
  if (pg)
    return pg;
  return findModule(RtlModuleKind::memory);
}

StringSeq
RtlDesign::artifactNames() const
{
  StringSeq names;
  for (const RtlModule &module : modules_)
    names.push_back(module.artifactName());
  return names;
}

StringSeq
RtlDesign::possibleArtifactNames() const
{
  StringSeq names;
  for (RtlModuleKind kind : {RtlModuleKind::memory,
                             RtlModuleKind::clock_gate,
                             RtlModuleKind::ecc_encoder,
                             RtlModuleKind::ecc_decoder,
                             RtlModuleKind::power_gate})
    names.push_back(moduleName(kind) + ".v");
  return names;
}

} // namespace sram
