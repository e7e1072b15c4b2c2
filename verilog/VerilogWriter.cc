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

#include "VerilogWriter.hh"

#include <cerrno>

#include "SramBuildConfig.hh"
#include "Error.hh"
#include "RtlDesign.hh"

namespace sram {

class VerilogWriter
{
public:
  VerilogWriter(const RtlDesign &design,
                FILE *stream);
  void writeModule(const RtlModule &module);

protected:
  void writeHeader(const RtlModule &module);
  void writePorts(const RtlModule &module);
  void writeParams(const RtlModule &module);
  void writePortDcls(const RtlModule &module);
  void writeNetDcls(const RtlModule &module);
  void writeInstances(const RtlModule &module);
  void writeInstance(const RtlInstance &inst);
  void writeRange(const RtlNet &net);
  const char *verilogPortDir(RtlPortDir dir);

  void writeMemory(const RtlModule &module);
  void writeClockGate();
  void writeEccEncoder();
  void writeEccDecoder();
  void writePowerGate(const RtlModule &module);
  void writeXorTerms(const IntSeq &bits,
                     const char *bus);

  const RtlDesign &design_;
  const SramConfig &config_;
  FILE *stream_;
};

void
writeVerilogModule(const RtlDesign &design,
                   const RtlModule &module,
                   FILE *stream)
{
  VerilogWriter writer(design, stream);
  writer.writeModule(module);
}

void
writeVerilogModule(const RtlDesign &design,
                   const RtlModule &module,
                   const char *filename)
{
  FILE *stream = fopen(filename, "w");
  if (stream == nullptr)
    throw FileNotWritable(filename, errno);
  writeVerilogModule(design, module, stream);
  bool write_failed = ferror(stream);
  int write_errno = errno;
  if (fclose(stream) != 0 || write_failed)
    throw FileNotWritable(filename, write_failed ? write_errno : errno);
}

VerilogWriter::VerilogWriter(const RtlDesign &design,
                             FILE *stream) :
  design_(design),
  config_(design.config()),
  stream_(stream)
{
}

void
VerilogWriter::writeModule(const RtlModule &module)
{
  writeHeader(module);
  fprintf(stream_, "module %s (", module.name().c_str());
  writePorts(module);
  writeParams(module);
  writePortDcls(module);
  writeNetDcls(module);
  fprintf(stream_, "\n");
  writeInstances(module);
  switch (module.kind()) {
  case RtlModuleKind::memory:
    writeMemory(module);
    break;
  case RtlModuleKind::clock_gate:
    writeClockGate();
    break;
  case RtlModuleKind::ecc_encoder:
    writeEccEncoder();
    break;
  case RtlModuleKind::ecc_decoder:
    writeEccDecoder();
    break;
  case RtlModuleKind::power_gate:
    writePowerGate(module);
    break;
  }
  fprintf(stream_, "endmodule\n");
}

void
VerilogWriter::writeHeader(const RtlModule &module)
{
  fprintf(stream_, "// %s\n", module.name().c_str());
  fprintf(stream_, "// Generated by SramCompiler %s\n", SRAM_VERSION);
  fprintf(stream_, "// Configuration fingerprint %s\n",
          config_.fingerprint().c_str());
  fprintf(stream_, "// depth %d width %d banks %d process %dnm voltage %.9g\n",
          config_.depth(),
          config_.width(),
          config_.banks(),
          config_.processNode(),
          config_.voltage());
  fprintf(stream_, "// power_gating %d clock_gating %d retention_mode %d ecc_enable %d\n\n",
          config_.powerGating(),
          config_.clockGating(),
          config_.retentionMode(),
          config_.eccEnable());
}

void
VerilogWriter::writePorts(const RtlModule &module)
{
  bool first = true;
  for (const RtlPort &port : module.ports()) {
    if (!first)
      fprintf(stream_, ",\n    ");
    fprintf(stream_, "%s", port.name().c_str());
    first = false;
  }
  fprintf(stream_, ");\n");
}

void
VerilogWriter::writeParams(const RtlModule &module)
{
  for (const RtlParam &param : module.params())
    fprintf(stream_, " parameter %s = %s;\n",
            param.name.c_str(),
            param.value.c_str());
}

void
VerilogWriter::writeRange(const RtlNet &net)
{
  if (!net.widthParam().empty())
    fprintf(stream_, " [%s-1:0]", net.widthParam().c_str());
  else if (net.isBus())
    fprintf(stream_, " [%d:0]", net.width() - 1);
}

const char *
VerilogWriter::verilogPortDir(RtlPortDir dir)
{
  switch (dir) {
  case RtlPortDir::input:
    return "input";
  case RtlPortDir::output:
    return "output";
  }
  criticalError(1500, "unknown port direction");
  return nullptr;
}

void
VerilogWriter::writePortDcls(const RtlModule &module)
{
  for (const RtlPort &port : module.ports()) {
    fprintf(stream_, " %s", verilogPortDir(port.dir()));
    writeRange(port);
    fprintf(stream_, " %s;\n", port.name().c_str());
  }
}

void
VerilogWriter::writeNetDcls(const RtlModule &module)
{
  for (const RtlNet &net : module.nets()) {
    fprintf(stream_, " %s", net.isReg() ? "reg" : "wire");
    writeRange(net);
    fprintf(stream_, " %s;\n", net.name().c_str());
  }
}

void
VerilogWriter::writeInstances(const RtlModule &module)
{
  for (const RtlInstance &inst : module.instances())
    writeInstance(inst);
  if (!module.instances().empty())
    fprintf(stream_, "\n");
}

void
VerilogWriter::writeInstance(const RtlInstance &inst)
{
  fprintf(stream_, " %s", inst.moduleName().c_str());
  if (!inst.params().empty()) {
    fprintf(stream_, " #(");
    bool first = true;
    for (const RtlParam &param : inst.params()) {
      if (!first)
        fprintf(stream_, ",\n    ");
      fprintf(stream_, ".%s(%s)", param.name.c_str(), param.value.c_str());
      first = false;
    }
    fprintf(stream_, ")");
  }
  fprintf(stream_, " %s (", inst.name().c_str());
  bool first = true;
  for (const RtlConnection &connection : inst.connections()) {
    if (!first)
      fprintf(stream_, ",\n    ");
    fprintf(stream_, ".%s(%s)",
            connection.port.c_str(),
            connection.net.c_str());
    first = false;
  }
  fprintf(stream_, ");\n");
}

////////////////////////////////////////////////////////////////

void
VerilogWriter::writeMemory(const RtlModule &module)
{
  if (module.findPort("ret_en"))
    // Retention holds contents and blocks accesses.
    fprintf(stream_, " assign access_en = ce & ~ret_en;\n");
  else
    fprintf(stream_, " assign access_en = ce;\n");
  if (module.findInstance("clk_gate") == nullptr)
    fprintf(stream_, " assign array_clk = clk;\n");
  if (module.findInstance("ecc_enc") == nullptr)
    fprintf(stream_, " assign wcode = wdata;\n");
  if (module.findInstance("ecc_dec") == nullptr)
    fprintf(stream_, " assign rdata = rcode;\n");
  fprintf(stream_, " assign bank_index = addr / WORDS_PER_BANK;\n");
  fprintf(stream_, " assign word_addr = addr %% WORDS_PER_BANK;\n\n");

  fprintf(stream_, " genvar b;\n");
  fprintf(stream_, " generate\n");
  fprintf(stream_, "  for (b = 0; b < BANKS; b = b + 1) begin : bank\n");
  fprintf(stream_, "   reg [CODE_WIDTH-1:0] mem [0:WORDS_PER_BANK-1];\n");
  fprintf(stream_, "   reg [CODE_WIDTH-1:0] dout;\n");
  if (module.findPort("pwr_en"))
    fprintf(stream_, "   assign bank_sel[b] = access_en & pwr_en[b] & (bank_index == b);\n");
  else
    fprintf(stream_, "   assign bank_sel[b] = access_en & (bank_index == b);\n");
  fprintf(stream_, "   always @(posedge array_clk) begin\n");
  fprintf(stream_, "    if (bank_sel[b]) begin\n");
  fprintf(stream_, "     if (we)\n");
  fprintf(stream_, "      mem[word_addr] <= wcode;\n");
  fprintf(stream_, "     else\n");
  fprintf(stream_, "      dout <= mem[word_addr];\n");
  fprintf(stream_, "    end\n");
  fprintf(stream_, "   end\n");
  fprintf(stream_, "   assign bank_rcode[b*CODE_WIDTH +: CODE_WIDTH] = dout;\n");
  fprintf(stream_, "  end\n");
  fprintf(stream_, " endgenerate\n\n");

  fprintf(stream_, " always @(posedge array_clk)\n");
  fprintf(stream_, "  if (access_en & ~we)\n");
  fprintf(stream_, "   rd_bank <= bank_index;\n");
  fprintf(stream_, " assign rcode = bank_rcode[rd_bank*CODE_WIDTH +: CODE_WIDTH];\n");
}

void
VerilogWriter::writeClockGate()
{
  // Latch is transparent while clk is low so en cannot glitch gclk.
  fprintf(stream_, " always @(clk or en)\n");
  fprintf(stream_, "  if (!clk)\n");
  fprintf(stream_, "   en_latch <= en;\n");
  fprintf(stream_, " assign gclk = clk & en_latch;\n");
}

void
VerilogWriter::writeXorTerms(const IntSeq &bits,
                             const char *bus)
{
  int count = 0;
  for (int bit : bits) {
    if (count > 0) {
      if (count % 8 == 0)
        fprintf(stream_, "\n    ^ ");
      else
        fprintf(stream_, " ^ ");
    }
    fprintf(stream_, "%s[%d]", bus, bit);
    count++;
  }
  if (count == 0)
    fprintf(stream_, "1'b0");
}

void
VerilogWriter::writeEccEncoder()
{
  const EccCode *code = design_.eccCode();
  for (int check = 0; check < code->checkBits(); check++) {
    fprintf(stream_, " assign check[%d] = ", check);
    writeXorTerms(code->parityGroup(check), "data_in");
    fprintf(stream_, ";\n");
  }
  fprintf(stream_, " assign code_out[DATA_WIDTH-1:0] = data_in;\n");
  fprintf(stream_, " assign code_out[CODE_WIDTH-2:DATA_WIDTH] = check;\n");
  fprintf(stream_, " assign code_out[CODE_WIDTH-1] = ^{check, data_in};\n");
}

void
VerilogWriter::writeEccDecoder()
{
  const EccCode *code = design_.eccCode();
  int check_bits = code->checkBits();
  for (int check = 0; check < check_bits; check++) {
    fprintf(stream_, " assign syndrome[%d] = code_in[%d] ^ ",
            check, code->checkIndex(check));
    writeXorTerms(code->parityGroup(check), "code_in");
    fprintf(stream_, ";\n");
  }
  fprintf(stream_, " assign parity_err = ^code_in;\n");
  // An odd error count with a data position syndrome flips that bit.
  for (int bit = 0; bit < code->dataBits(); bit++)
    fprintf(stream_, " assign data_out[%d] = code_in[%d] ^ (parity_err & (syndrome == %d'd%d));\n",
            bit, bit, check_bits, code->dataPosition(bit));
  fprintf(stream_, " assign correctable = parity_err;\n");
  fprintf(stream_, " assign uncorrectable = ~parity_err & (|syndrome);\n");
}

void
VerilogWriter::writePowerGate(const RtlModule &module)
{
  // Enables are combinational so a bank is powered in the cycle it is
  // accessed. Sleep only drops the enables of banks not being accessed.
  if (module.findPort("ret_en"))
    fprintf(stream_, " assign access_req = ce & ~ret_en;\n");
  else
    fprintf(stream_, " assign access_req = ce;\n");
  fprintf(stream_, " assign bank_index = addr / WORDS_PER_BANK;\n\n");
  fprintf(stream_, " genvar b;\n");
  fprintf(stream_, " generate\n");
  fprintf(stream_, "  for (b = 0; b < BANKS; b = b + 1) begin : bank_pwr\n");
  fprintf(stream_, "   assign pwr_en[b] = ~sleep | (access_req & (bank_index == b));\n");
  fprintf(stream_, "  end\n");
  fprintf(stream_, " endgenerate\n");
}

} // namespace sram
