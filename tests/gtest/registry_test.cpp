/**
 * @file registry_test.cpp
 * @brief Google Test suite for the OBD2 parameter registry
 */

#include <gtest/gtest.h>
#include "obd2_registry.hpp"

using namespace obd2;

// ============================================================================
// Lookup Tests
// ============================================================================

TEST(RegistryLookupTest, KnownCode) {
  auto rpm = lookup("RPM");
  ASSERT_TRUE(rpm.ok);
  EXPECT_EQ(rpm.value.code, "RPM");
  EXPECT_EQ(rpm.value.mode, Mode::CurrentData);
  ASSERT_TRUE(rpm.value.pid.has_value());
  EXPECT_EQ(*rpm.value.pid, 0x0C);
  EXPECT_EQ(rpm.value.byte_count, 4);
  EXPECT_EQ(rpm.value.data_bytes(), 2);
  ASSERT_EQ(rpm.value.fields.size(), 1u);
  EXPECT_DOUBLE_EQ(rpm.value.fields[0].scaling, 0.25);
  EXPECT_DOUBLE_EQ(rpm.value.fields[0].max_value, 16383);
}

TEST(RegistryLookupTest, CaseInsensitive) {
  auto ect = lookup("ect");
  ASSERT_TRUE(ect.ok);
  EXPECT_EQ(ect.value.code, "ECT");
  EXPECT_EQ(ect.value.name, "Engine Coolant Temp");
}

TEST(RegistryLookupTest, UnknownCode) {
  auto r = lookup("NOPE");
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.error.code, ErrorCode::InvalidParameter);
  EXPECT_EQ(r.error.message(), "'NOPE' is an invalid parameter name.");
  EXPECT_FALSE(is_known("NOPE"));
  EXPECT_TRUE(is_known("ODO"));
}

TEST(RegistryLookupTest, ReversePidLookup) {
  auto r = lookup_pid(0xA6);
  ASSERT_TRUE(r.ok);
  EXPECT_EQ(r.value.code, "ODO");

  auto bad = lookup_pid(0x02);
  EXPECT_FALSE(bad.ok);
  EXPECT_EQ(bad.error.code, ErrorCode::InvalidParameter);
  EXPECT_EQ(bad.error.value, "0x02");
}

// ============================================================================
// Special Entries
// ============================================================================

TEST(RegistrySpecialTest, Vin) {
  auto vin = lookup("VIN");
  ASSERT_TRUE(vin.ok);
  EXPECT_EQ(vin.value.mode, Mode::VehicleInformation);
  EXPECT_FALSE(vin.value.pid.has_value());
  EXPECT_EQ(vin.value.byte_count, 20);
  EXPECT_FALSE(vin.value.has_scaling());
}

TEST(RegistrySpecialTest, Dtc) {
  auto dtc = lookup("DTC");
  ASSERT_TRUE(dtc.ok);
  EXPECT_EQ(dtc.value.name, "Active DTCs");
  EXPECT_EQ(dtc.value.mode, Mode::StoredDTCs);
  EXPECT_FALSE(dtc.value.has_scaling());
}

TEST(RegistrySpecialTest, CompositeEntries) {
  auto ert = lookup("ERT");
  ASSERT_TRUE(ert.ok);
  EXPECT_TRUE(ert.value.is_composite());
  EXPECT_EQ(ert.value.fields.size(), 3u);
  EXPECT_EQ(ert.value.byte_count, 15);

  auto def = lookup("DEF");
  ASSERT_TRUE(def.ok);
  ASSERT_EQ(def.value.fields.size(), 3u);
  EXPECT_EQ(def.value.fields[1].kind, ScalingKind::Offset);
  EXPECT_DOUBLE_EQ(def.value.fields[1].min_value, -40);
}

// ============================================================================
// Table Invariants
// ============================================================================

TEST(RegistryTableTest, EveryCodeResolves) {
  const auto codes = parameter_codes();
  EXPECT_EQ(codes.size(), 24u);
  for (const auto& code : codes) {
    EXPECT_TRUE(lookup(code).ok) << code;
  }
}

TEST(RegistryTableTest, FieldBoundsAreOrdered) {
  for (const auto& p : parameters()) {
    for (const auto& f : p.fields) {
      EXPECT_LE(f.min_value, f.max_value) << p.code;
      EXPECT_GT(f.scaling, 0.0) << p.code;
    }
  }
}

TEST(RegistryTableTest, ModeOneEntriesHaveScaling) {
  for (const auto& p : parameters()) {
    if (p.mode != Mode::CurrentData) continue;
    EXPECT_TRUE(p.pid.has_value()) << p.code;
    EXPECT_TRUE(p.has_scaling()) << p.code;

    size_t width = p.is_composite() ? 1 : 0;
    for (const auto& f : p.fields) width += f.width;
    EXPECT_EQ(width, p.data_bytes()) << p.code;
  }
}

TEST(RegistryTableTest, PidsAreUnique) {
  std::vector<uint8_t> seen;
  for (const auto& p : parameters()) {
    if (!p.pid) continue;
    for (uint8_t s : seen) {
      EXPECT_NE(s, *p.pid) << p.code;
    }
    seen.push_back(*p.pid);
  }
}

// ============================================================================
// Helper Functions
// ============================================================================

TEST(RegistryHelperTest, FuelTypeNames) {
  EXPECT_STREQ(fuel_type_name(1), "Gasoline");
  EXPECT_STREQ(fuel_type_name(4), "Diesel");
  EXPECT_STREQ(fuel_type_name(8), "Electric");
  EXPECT_STREQ(fuel_type_name(5), "Unknown");
}

TEST(RegistryHelperTest, UnitStrings) {
  EXPECT_STREQ(unit_symbol(Unit::DegreeCelsius), "°C");
  EXPECT_STREQ(unit_symbol(Unit::KilometersPerHour), "km/h");
  EXPECT_STREQ(unit_symbol(Unit::NoUnit), "");
  EXPECT_STREQ(unit_name(Unit::RevolutionsPerMinute), "Revolutions per Minute");
  EXPECT_STREQ(scaling_kind_name(ScalingKind::Offset), "offset");
}
