#include <gtest/gtest.h>
#include <string>
#include "SramConfig.hh"
#include "ProcessTable.hh"
#include "FeatureTable.hh"
#include "Error.hh"

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
          {"clock_gating", "false"},
          {"retention_mode", "false"},
          {"ecc_enable", "false"}};
}

static SramConfigFields
baseFields()
{
  SramConfigFields fields;
  fields.depth = 1024;
  fields.width = 32;
  fields.banks = 1;
  fields.voltage = 1.0;
  fields.process_node = 28;
  return fields;
}

class SramConfigTest : public ::testing::Test {
protected:
  // Returns the offending field of the rejected configuration.
  std::string rejectedField(const SramConfigValues &values)
  {
    try {
      SramConfig config(values, &process_table_);
    }
    catch (const ConfigurationError &error) {
      return error.field();
    }
    return "";
  }

  std::string rejectedField(const SramConfigFields &fields)
  {
    try {
      SramConfig config(fields, &process_table_);
    }
    catch (const ConfigurationError &error) {
      return error.field();
    }
    return "";
  }

  ProcessTable process_table_;
};

TEST_F(SramConfigTest, ParseValues) {
  SramConfigValues values = baseValues();
  values["ecc_enable"] = "true";
  SramConfig config(values, &process_table_);
  EXPECT_EQ(config.depth(), 1024);
  EXPECT_EQ(config.width(), 32);
  EXPECT_EQ(config.banks(), 1);
  EXPECT_DOUBLE_EQ(config.voltage(), 1.0);
  EXPECT_EQ(config.processNode(), 28);
  EXPECT_TRUE(config.eccEnable());
  EXPECT_FALSE(config.powerGating());
  EXPECT_FALSE(config.clockGating());
  EXPECT_FALSE(config.retentionMode());
  EXPECT_EQ(config.process().node(), 28);
}

TEST_F(SramConfigTest, BooleanSpellings) {
  SramConfigValues values = baseValues();
  values["power_gating"] = "1";
  values["clock_gating"] = "yes";
  values["retention_mode"] = "ON";
  values["ecc_enable"] = "True";
  SramConfig config(values, &process_table_);
  EXPECT_TRUE(config.powerGating());
  EXPECT_TRUE(config.clockGating());
  EXPECT_TRUE(config.retentionMode());
  EXPECT_TRUE(config.eccEnable());

  values["power_gating"] = "0";
  values["clock_gating"] = "no";
  values["retention_mode"] = "off";
  values["ecc_enable"] = "FALSE";
  SramConfig config2(values, &process_table_);
  EXPECT_FALSE(config2.powerGating());
  EXPECT_FALSE(config2.clockGating());
  EXPECT_FALSE(config2.retentionMode());
  EXPECT_FALSE(config2.eccEnable());
}

TEST_F(SramConfigTest, BadBoolean) {
  SramConfigValues values = baseValues();
  values["clock_gating"] = "maybe";
  EXPECT_EQ(rejectedField(values), "clock_gating");
}

TEST_F(SramConfigTest, MissingField) {
  SramConfigValues values = baseValues();
  values.erase("voltage");
  try {
    SramConfig config(values, &process_table_);
    FAIL();
  }
  catch (const ConfigurationError &error) {
    EXPECT_STREQ(error.field(), "voltage");
    EXPECT_STREQ(error.value(), "");
  }
}

TEST_F(SramConfigTest, UnknownField) {
  SramConfigValues values = baseValues();
  values["read_ports"] = "2";
  EXPECT_EQ(rejectedField(values), "read_ports");
}

TEST_F(SramConfigTest, NotANumber) {
  SramConfigValues values = baseValues();
  values["depth"] = "1k";
  EXPECT_EQ(rejectedField(values), "depth");
  values = baseValues();
  values["width"] = "";
  EXPECT_EQ(rejectedField(values), "width");
  values = baseValues();
  values["voltage"] = "nan";
  EXPECT_EQ(rejectedField(values), "voltage");
  values = baseValues();
  values["depth"] = "99999999999";
  EXPECT_EQ(rejectedField(values), "depth");
}

TEST_F(SramConfigTest, DepthRange) {
  SramConfigFields fields = baseFields();
  fields.depth = 1;
  EXPECT_EQ(rejectedField(fields), "depth");
  fields.depth = 0;
  EXPECT_EQ(rejectedField(fields), "depth");
  fields.depth = -16;
  EXPECT_EQ(rejectedField(fields), "depth");
  fields.depth = 2;
  EXPECT_EQ(rejectedField(fields), "");
}

TEST_F(SramConfigTest, WidthRange) {
  SramConfigFields fields = baseFields();
  fields.width = 0;
  EXPECT_EQ(rejectedField(fields), "width");
  fields.width = sram_width_max + 1;
  EXPECT_EQ(rejectedField(fields), "width");
  fields.width = 1;
  EXPECT_EQ(rejectedField(fields), "");
}

TEST_F(SramConfigTest, BanksExceedDepth) {
  SramConfigFields fields = baseFields();
  fields.depth = 4;
  fields.banks = 8;
  try {
    SramConfig config(fields, &process_table_);
    FAIL();
  }
  catch (const ConfigurationError &error) {
    EXPECT_STREQ(error.field(), "banks");
    EXPECT_STREQ(error.value(), "8");
  }
}

TEST_F(SramConfigTest, BanksDivideDepth) {
  SramConfigFields fields = baseFields();
  fields.depth = 1000;
  fields.banks = 3;
  EXPECT_EQ(rejectedField(fields), "banks");
  fields.banks = 8;
  EXPECT_EQ(rejectedField(fields), "");
  fields.banks = 0;
  EXPECT_EQ(rejectedField(fields), "banks");
}

TEST_F(SramConfigTest, VoltageRange) {
  SramConfigFields fields = baseFields();
  fields.voltage = 0.0;
  EXPECT_EQ(rejectedField(fields), "voltage");
  fields.voltage = -1.0;
  EXPECT_EQ(rejectedField(fields), "voltage");
  fields.voltage = 5.5;
  EXPECT_EQ(rejectedField(fields), "voltage");
  // Outside the 28nm model range but a plausible supply.
  fields.voltage = 1.5;
  EXPECT_EQ(rejectedField(fields), "");
}

TEST_F(SramConfigTest, UnsupportedNode) {
  SramConfigFields fields = baseFields();
  fields.process_node = 22;
  try {
    SramConfig config(fields, &process_table_);
    FAIL();
  }
  catch (const ConfigurationError &error) {
    EXPECT_STREQ(error.field(), "process_node");
    EXPECT_STREQ(error.value(), "22");
    // Supported nodes are listed.
    EXPECT_NE(std::string(error.what()).find("180 130 90 65 45 28 16 7"),
              std::string::npos);
  }
}

TEST_F(SramConfigTest, DerivedValues) {
  SramConfigFields fields = baseFields();
  fields.banks = 4;
  SramConfig config(fields, &process_table_);
  EXPECT_EQ(config.addressWidth(), 10);
  EXPECT_EQ(config.wordsPerBank(), 256);
  EXPECT_EQ(config.eccCheckBits(), 0);
  EXPECT_EQ(config.codeWidth(), 32);
  EXPECT_EQ(config.moduleName(), "sram_1024x32_b4");
}

TEST_F(SramConfigTest, AddressWidthNonPowerOfTwo) {
  SramConfigFields fields = baseFields();
  fields.depth = 1000;
  SramConfig config(fields, &process_table_);
  EXPECT_EQ(config.addressWidth(), 10);
  fields.depth = 2;
  SramConfig config2(fields, &process_table_);
  EXPECT_EQ(config2.addressWidth(), 1);
  fields.depth = 1025;
  SramConfig config3(fields, &process_table_);
  EXPECT_EQ(config3.addressWidth(), 11);
}

TEST_F(SramConfigTest, EccCheckBits) {
  EXPECT_EQ(hammingCheckBits(1), 2);
  EXPECT_EQ(hammingCheckBits(4), 3);
  EXPECT_EQ(hammingCheckBits(8), 4);
  EXPECT_EQ(hammingCheckBits(32), 6);
  EXPECT_EQ(hammingCheckBits(64), 7);
  SramConfigFields fields = baseFields();
  fields.ecc_enable = true;
  SramConfig config(fields, &process_table_);
  EXPECT_EQ(config.eccCheckBits(), 7);
  EXPECT_EQ(config.codeWidth(), 39);
}

TEST_F(SramConfigTest, Enabled) {
  SramConfigFields fields = baseFields();
  fields.clock_gating = true;
  fields.retention_mode = true;
  SramConfig config(fields, &process_table_);
  EXPECT_FALSE(config.enabled(SramFeature::ecc));
  EXPECT_TRUE(config.enabled(SramFeature::clock_gating));
  EXPECT_FALSE(config.enabled(SramFeature::power_gating));
  EXPECT_TRUE(config.enabled(SramFeature::retention));
}

TEST_F(SramConfigTest, Fingerprint) {
  SramConfig config1(baseValues(), &process_table_);
  SramConfig config2(baseFields(), &process_table_);
  EXPECT_EQ(config1.canonicalText(), config2.canonicalText());
  EXPECT_EQ(config1.fingerprint(), config2.fingerprint());
  EXPECT_EQ(config1.fingerprint().size(), 16u);

  SramConfigFields fields = baseFields();
  fields.ecc_enable = true;
  SramConfig config3(fields, &process_table_);
  EXPECT_NE(config1.fingerprint(), config3.fingerprint());
}

TEST_F(SramConfigTest, CanonicalText) {
  SramConfig config(baseFields(), &process_table_);
  EXPECT_EQ(config.canonicalText(),
            "depth=1024\n"
            "width=32\n"
            "banks=1\n"
            "voltage=1\n"
            "process_node=28\n"
            "power_gating=0\n"
            "clock_gating=0\n"
            "retention_mode=0\n"
            "ecc_enable=0\n");
}

////////////////////////////////////////////////////////////////

class ProcessTableTest : public ::testing::Test {
protected:
  ProcessTable table_;
};

TEST_F(ProcessTableTest, BuiltinNodes) {
  ProcessNodeSeq nodes = table_.nodes();
  ProcessNodeSeq expected = {180, 130, 90, 65, 45, 28, 16, 7};
  EXPECT_EQ(nodes, expected);
  EXPECT_EQ(table_.findNode(22), nullptr);
}

TEST_F(ProcessTableTest, NodeConstants) {
  const ProcessNode *node = table_.findNode(28);
  ASSERT_NE(node, nullptr);
  EXPECT_DOUBLE_EQ(node->bitcellArea(), 0.127);
  EXPECT_DOUBLE_EQ(node->vmin(), 0.7);
  EXPECT_DOUBLE_EQ(node->vmax(), 1.1);
  EXPECT_DOUBLE_EQ(node->leakageDensity(), 20.0);
  const ProcessNode *node7 = table_.findNode(7);
  ASSERT_NE(node7, nullptr);
  EXPECT_TRUE(node7->voltageSupported(0.75));
  EXPECT_TRUE(node7->voltageSupported(0.9));
  EXPECT_FALSE(node7->voltageSupported(1.0));
  EXPECT_FALSE(node7->voltageSupported(0.5));
}

TEST_F(ProcessTableTest, SmallerNodesShrink) {
  ProcessNodeSeq nodes = table_.nodes();
  for (size_t i = 1; i < nodes.size(); i++) {
    const ProcessNode *larger = table_.findNode(nodes[i - 1]);
    const ProcessNode *smaller = table_.findNode(nodes[i]);
    EXPECT_LT(smaller->bitcellArea(), larger->bitcellArea());
    EXPECT_GT(smaller->leakageDensity(), larger->leakageDensity());
    EXPECT_LT(smaller->baseAccess(), larger->baseAccess());
  }
}

TEST_F(ProcessTableTest, DefineNode) {
  table_.defineNode(ProcessNode(22, 0.1, 0.7, 1.0, 0.85, 0.33, 0.3,
                                0.011, 0.18, 0.11, 0.04, 25.0));
  const ProcessNode *node = table_.findNode(22);
  ASSERT_NE(node, nullptr);
  EXPECT_DOUBLE_EQ(node->vnom(), 0.85);
  EXPECT_EQ(table_.nodes().size(), 9u);

  SramConfigFields fields = baseFields();
  fields.process_node = 22;
  fields.voltage = 0.85;
  SramConfig config(fields, &table_);
  EXPECT_EQ(config.process().node(), 22);
}

TEST_F(ProcessTableTest, RedefineNode) {
  table_.defineNode(ProcessNode(28, 0.2, 0.7, 1.1, 0.9, 0.35, 0.35,
                                0.012, 0.2, 0.12, 0.05, 20.0));
  EXPECT_DOUBLE_EQ(table_.findNode(28)->bitcellArea(), 0.2);
  EXPECT_EQ(table_.nodes().size(), 8u);
}

TEST_F(ProcessTableTest, DefineInvalidNode) {
  // vmin at vth.
  EXPECT_THROW(table_.defineNode(ProcessNode(22, 0.1, 0.33, 1.0, 0.85, 0.33,
                                             0.3, 0.011, 0.18, 0.11, 0.04,
                                             25.0)),
               ConfigurationError);
  // vnom above vmax.
  EXPECT_THROW(table_.defineNode(ProcessNode(22, 0.1, 0.7, 1.0, 1.2, 0.33,
                                             0.3, 0.011, 0.18, 0.11, 0.04,
                                             25.0)),
               ConfigurationError);
  // Zero bitcell area.
  EXPECT_THROW(table_.defineNode(ProcessNode(22, 0.0, 0.7, 1.0, 0.85, 0.33,
                                             0.3, 0.011, 0.18, 0.11, 0.04,
                                             25.0)),
               ConfigurationError);
  EXPECT_EQ(table_.findNode(22), nullptr);
}

////////////////////////////////////////////////////////////////

TEST(FeatureTableTest, Adjusts) {
  FeatureTable table;
  const FeatureAdjustSeq &adjusts = table.adjusts();
  EXPECT_EQ(adjusts[0].feature, SramFeature::ecc);
  EXPECT_EQ(adjusts[1].feature, SramFeature::clock_gating);
  EXPECT_EQ(adjusts[2].feature, SramFeature::power_gating);
  EXPECT_EQ(adjusts[3].feature, SramFeature::retention);
  for (const FeatureAdjust &adjust : adjusts) {
    EXPECT_GE(adjust.periphery_factor, 0.0);
    EXPECT_GE(adjust.cycle_margin_scale, 0.0);
    EXPECT_LE(adjust.dynamic_scale, 1.0);
    EXPECT_LE(adjust.static_scale, 1.0);
  }
  EXPECT_LT(table.adjust(SramFeature::clock_gating).dynamic_scale, 1.0);
  EXPECT_LT(table.adjust(SramFeature::power_gating).static_scale, 1.0);
  EXPECT_GT(table.adjust(SramFeature::retention).retention_fraction, 0.0);
}

TEST(FeatureTableTest, Names) {
  EXPECT_STREQ(featureName(SramFeature::ecc), "ecc_enable");
  EXPECT_STREQ(featureName(SramFeature::retention), "retention_mode");
  EXPECT_EQ(sram_feature_names.find("power_gating", SramFeature::ecc),
            SramFeature::power_gating);
}

} // namespace sram
