/**
 * @file scaling_test.cpp
 * @brief Google Test suite for decoding, encoding and clamping of parameter values
 */

#include <gtest/gtest.h>
#include "obd2_scaling.hpp"
#include <cmath>
#include <limits>

using namespace obd2;
using namespace obd2::scaling;

// ============================================================================
// Byte Conversion Tests
// ============================================================================

TEST(ByteConversionTest, BytesToUint) {
  EXPECT_EQ(bytes_to_uint({0x2E, 0xE0}), 0x2EE0u);
  EXPECT_EQ(bytes_to_uint({0x12, 0x34, 0x56, 0x78}), 0x12345678u);
  EXPECT_EQ(bytes_to_uint({}), 0u);
}

TEST(ByteConversionTest, UintToBytes) {
  EXPECT_EQ(uint_to_bytes(0x2EE0, 2), (Bytes{0x2E, 0xE0}));
  EXPECT_EQ(uint_to_bytes(0x0A, 4), (Bytes{0x00, 0x00, 0x00, 0x0A}));
}

// ============================================================================
// Scaling Kind Tests
// ============================================================================

TEST(ScalingKindTest, ParseKnownTags) {
  EXPECT_EQ(parse_scaling_kind("int").value, ScalingKind::Int);
  EXPECT_EQ(parse_scaling_kind("Percent").value, ScalingKind::Percent);
  EXPECT_EQ(parse_scaling_kind("OFFSET").value, ScalingKind::Offset);
  EXPECT_EQ(parse_scaling_kind("float").value, ScalingKind::Float);
}

TEST(ScalingKindTest, RejectUnknownTag) {
  auto r = parse_scaling_kind("linear");
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.error.code, ErrorCode::InvalidScaling);
  EXPECT_EQ(r.error.message(), "'linear' has no associated scaling unit.");
}

// ============================================================================
// Decoding Tests
// ============================================================================

TEST(ScaleTest, CoolantTemperatureOffset) {
  auto r = scale_value("ECT", {0x28});
  ASSERT_TRUE(r.ok);
  EXPECT_DOUBLE_EQ(r.value, 0.0);

  EXPECT_DOUBLE_EQ(scale_value("ECT", {0x00}).value, -40.0);
  EXPECT_DOUBLE_EQ(scale_value("ECT", {0xFF}).value, 215.0);
}

TEST(ScaleTest, EngineSpeed) {
  auto r = scale_value("RPM", {0x2E, 0xE0});
  ASSERT_TRUE(r.ok);
  EXPECT_DOUBLE_EQ(r.value, 3000.0);
}

TEST(ScaleTest, PercentAndFloat) {
  EXPECT_NEAR(scale_value("CEL", {0xFF}).value, 100.0, 1e-9);
  EXPECT_NEAR(scale_value("MAF", {0x01, 0xF4}).value, 5.0, 1e-9);
  EXPECT_NEAR(scale_value("ODO", {0x00, 0x00, 0x30, 0x39}).value, 1234.5, 1e-9);
}

TEST(ScaleTest, MalfunctionIndicator) {
  EXPECT_DOUBLE_EQ(scale_value("MIL", {0x80, 0x00, 0x00, 0x00}).value, 1.0);
  EXPECT_DOUBLE_EQ(scale_value("MIL", {0x83, 0x07, 0x65, 0x04}).value, 1.0);
  EXPECT_DOUBLE_EQ(scale_value("MIL", {0x03, 0x07, 0x65, 0x04}).value, 0.0);
}

TEST(ScaleTest, CompositeDieselExhaustFluid) {
  auto r = scale("DEF", {0x07, 0x64, 0x41, 0xFF});
  ASSERT_TRUE(r.ok);
  ASSERT_EQ(r.value.size(), 3u);
  EXPECT_DOUBLE_EQ(r.value[0], 25.0);
  EXPECT_DOUBLE_EQ(r.value[1], 25.0);
  EXPECT_NEAR(r.value[2], 100.0, 1e-9);
}

TEST(ScaleTest, CompositeEngineRunTime) {
  auto r = scale("ERT", {0x07,
                         0x00, 0x00, 0x00, 0x0A,
                         0x00, 0x00, 0x00, 0x14,
                         0x00, 0x00, 0x00, 0x1E});
  ASSERT_TRUE(r.ok);
  ASSERT_EQ(r.value.size(), 3u);
  EXPECT_DOUBLE_EQ(r.value[0], 10.0);
  EXPECT_DOUBLE_EQ(r.value[1], 20.0);
  EXPECT_DOUBLE_EQ(r.value[2], 30.0);
}

TEST(ScaleTest, NoScalingForSpecialEntries) {
  auto vin = scale("VIN", {0x31});
  EXPECT_FALSE(vin.ok);
  EXPECT_EQ(vin.error.code, ErrorCode::InvalidScaling);
  EXPECT_EQ(vin.error.message(), "'VIN' has no associated scaling unit.");

  EXPECT_EQ(scale("DTC", {}).error.code, ErrorCode::InvalidScaling);
}

TEST(ScaleTest, UnknownCodeAndWrongLength) {
  EXPECT_EQ(scale("NOPE", {0x00}).error.code, ErrorCode::InvalidParameter);

  auto short_rpm = scale("RPM", {0x2E});
  EXPECT_FALSE(short_rpm.ok);
  EXPECT_EQ(short_rpm.error.code, ErrorCode::InvalidLength);
  EXPECT_EQ(short_rpm.error.value, "RPM");
}

// ============================================================================
// Encoding Tests
// ============================================================================

TEST(EncodeTest, ScalarValues) {
  EXPECT_EQ(encode_value("RPM", 3000).value, (Bytes{0x2E, 0xE0}));
  EXPECT_EQ(encode_value("ECT", 25).value, (Bytes{0x41}));
  EXPECT_EQ(encode_value("VSS", 88).value, (Bytes{0x58}));
  EXPECT_EQ(encode_value("CEL", 100).value, (Bytes{0xFF}));
  EXPECT_EQ(encode_value("ODO", 1234.5).value, (Bytes{0x00, 0x00, 0x30, 0x39}));
}

TEST(EncodeTest, MalfunctionIndicator) {
  EXPECT_EQ(encode_value("MIL", 1).value, (Bytes{0x80, 0x00, 0x00, 0x00}));
  EXPECT_EQ(encode_value("MIL", 0).value, (Bytes{0x00, 0x00, 0x00, 0x00}));
}

TEST(EncodeTest, CompositeFillsMissingWithMinimum) {
  auto r = encode("ERT", {10});
  ASSERT_TRUE(r.ok);
  EXPECT_EQ(r.value, (Bytes{0x07,
                            0x00, 0x00, 0x00, 0x0A,
                            0x00, 0x00, 0x00, 0x00,
                            0x00, 0x00, 0x00, 0x00}));

  auto def = encode("DEF", {25, 25, 100});
  ASSERT_TRUE(def.ok);
  EXPECT_EQ(def.value, (Bytes{0x07, 0x64, 0x41, 0xFF}));
}

TEST(EncodeTest, TooManyValues) {
  auto r = encode("RPM", {1000, 2000});
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.error.code, ErrorCode::InvalidLength);
}

TEST(EncodeTest, RoundTripWithinResolution) {
  for (const auto& p : parameters()) {
    if (!p.has_scaling() || p.is_composite() || p.code == "MIL") continue;
    const Field& f = p.fields[0];
    const double mid = f.min_value + (f.max_value - f.min_value) / 3.0;

    auto bytes = encode(p, {mid});
    ASSERT_TRUE(bytes.ok) << p.code;
    auto back = scale(p, bytes.value);
    ASSERT_TRUE(back.ok) << p.code;
    EXPECT_NEAR(back.value[0], mid, f.scaling / 2.0 + 1e-9) << p.code;
  }
}

TEST(EncodeTest, BoundsStayInclusive) {
  for (const auto& p : parameters()) {
    if (!p.has_scaling()) continue;

    std::vector<double> mins, maxs;
    for (const auto& f : p.fields) {
      mins.push_back(f.min_value);
      maxs.push_back(f.max_value);
    }

    auto low = scale(p, encode(p, mins).value);
    auto high = scale(p, encode(p, maxs).value);
    ASSERT_TRUE(low.ok) << p.code;
    ASSERT_TRUE(high.ok) << p.code;

    for (size_t i = 0; i < p.fields.size(); ++i) {
      EXPECT_GE(low.value[i], p.fields[i].min_value - 1e-6) << p.code;
      EXPECT_LE(high.value[i], p.fields[i].max_value + 1e-6) << p.code;
      EXPECT_GT(high.value[i], p.fields[i].max_value - p.fields[i].scaling) << p.code;
    }
  }
}

TEST(EncodeTest, AirEquivalenceRatioMaximum) {
  auto r = encode_value("ACE", 1.99);
  ASSERT_TRUE(r.ok);
  EXPECT_EQ(r.value, (Bytes{0xFE, 0xDD}));
}

// ============================================================================
// Clamping Tests
// ============================================================================

TEST(ClampTest, ClampsToFieldRange) {
  EXPECT_EQ(encode_value("VSS", 300).value, (Bytes{0xFF}));
  EXPECT_EQ(encode_value("VSS", -5).value, (Bytes{0x00}));
  EXPECT_EQ(encode_value("ECT", -100).value, (Bytes{0x00}));

  auto c = clamp("DEF", {99, -50});
  ASSERT_TRUE(c.ok);
  ASSERT_EQ(c.value.size(), 3u);
  EXPECT_DOUBLE_EQ(c.value[0], 63.75);
  EXPECT_DOUBLE_EQ(c.value[1], -40.0);
  EXPECT_DOUBLE_EQ(c.value[2], 0.0);
}

TEST(ClampTest, RejectWhenClampingDisabled) {
  EncodeOptions strict;
  strict.clamp = false;

  auto r = encode_value("VSS", 300, strict);
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.error.code, ErrorCode::ValueOutOfRange);
  EXPECT_EQ(r.error.value, "VSS=300");

  EXPECT_TRUE(encode_value("VSS", 255, strict).ok);
}

TEST(ClampTest, RejectNonFiniteValues) {
  const double nan = std::nan("");
  const double inf = std::numeric_limits<double>::infinity();

  EncodeOptions strict;
  strict.clamp = false;

  auto r = encode_value("VSS", nan, strict);
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.error.code, ErrorCode::ValueOutOfRange);

  EXPECT_EQ(encode_value("VSS", nan).error.code, ErrorCode::ValueOutOfRange);
  EXPECT_EQ(encode_value("RPM", inf).error.code, ErrorCode::ValueOutOfRange);
  EXPECT_EQ(encode_value("ECT", -inf, strict).error.code, ErrorCode::ValueOutOfRange);
  EXPECT_EQ(encode("DEF", {25, nan}).error.code, ErrorCode::ValueOutOfRange);

  auto c = clamp("FT", {nan});
  EXPECT_FALSE(c.ok);
  EXPECT_EQ(c.error.code, ErrorCode::ValueOutOfRange);
}

// ============================================================================
// Formatting Tests
// ============================================================================

TEST(FormatValueTest, UnitsAndPrecision) {
  EXPECT_EQ(format_value("ECT", {25}).value, "25 °C");
  EXPECT_EQ(format_value("RPM", {3000}).value, "3000 rpm");
  EXPECT_EQ(format_value("CEL", {50}).value, "50.0 %");
  EXPECT_EQ(format_value("MAF", {5}).value, "5.00 g/s");
  EXPECT_EQ(format_value("ECT", {25}, 1).value, "25.0 °C");
}

TEST(FormatValueTest, SpecialUnits) {
  EXPECT_EQ(format_value("MIL", {1}).value, "On");
  EXPECT_EQ(format_value("MIL", {0}).value, "Off");
  EXPECT_EQ(format_value("FT", {4}).value, "4 (Diesel)");
  EXPECT_EQ(format_value("ERT", {10, 20, 30}).value, "10 s, 20 s, 30 s");
}

TEST(FormatValueTest, FuelTypeOutsideByteRange) {
  EXPECT_EQ(format_value("FT", {300}).value, "300 (Unknown)");
  EXPECT_EQ(format_value("FT", {-1}).value, "-1 (Unknown)");
  EXPECT_NE(format_value("FT", {std::nan("")}).value.find("(Unknown)"), std::string::npos);
}

TEST(FormatValueTest, UnknownCode) {
  auto r = format_value("NOPE", {1});
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.error.code, ErrorCode::InvalidParameter);
  EXPECT_EQ(r.error.value, "NOPE");
}
