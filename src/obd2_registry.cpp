#include "obd2_registry.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace obd2 {

// ============================================================================
// Table construction helpers
// ============================================================================

namespace {

constexpr double kPercentScaling = 100.0 / 255.0;
constexpr double kTemperatureOffset = 40.0;

Field field(double min_value, double max_value, double scaling,
            ScalingKind kind, Unit unit, uint8_t width) {
  Field f;
  f.min_value = min_value;
  f.max_value = max_value;
  f.scaling = scaling;
  f.kind = kind;
  f.unit = unit;
  f.width = width;
  return f;
}

// Single-field Mode 01 parameter; the field spans all data bytes
Parameter scalar(const char* code, const char* name, uint8_t pid, uint8_t byte_count,
                 double min_value, double max_value, double scaling,
                 ScalingKind kind, Unit unit) {
  Parameter p;
  p.code = code;
  p.name = name;
  p.mode = Mode::CurrentData;
  p.pid = pid;
  p.byte_count = byte_count;
  p.fields.push_back(field(min_value, max_value, scaling, kind, unit,
                           static_cast<uint8_t>(byte_count - 2)));
  return p;
}

// Three-field Mode 01 parameter behind a support byte
Parameter composite(const char* code, const char* name, uint8_t pid, uint8_t byte_count,
                    std::vector<Field> fields) {
  Parameter p;
  p.code = code;
  p.name = name;
  p.mode = Mode::CurrentData;
  p.pid = pid;
  p.byte_count = byte_count;
  p.support_byte = 0x07;  // All three fields present
  p.fields = std::move(fields);
  return p;
}

Parameter special(const char* code, const char* name, Mode mode, uint8_t byte_count) {
  Parameter p;
  p.code = code;
  p.name = name;
  p.mode = mode;
  p.byte_count = byte_count;
  return p;
}

std::vector<Parameter> build_table() {
  using K = ScalingKind;
  using U = Unit;

  std::vector<Parameter> t;
  t.reserve(24);

  t.push_back(scalar("MIL", "Malfunction Indicator Lamp", 0x01, 6, 0, 1, 1, K::Int, U::Boolean));
  t.push_back(scalar("RPM", "RPM", 0x0C, 4, 0, 16383, 0.25, K::Int, U::RevolutionsPerMinute));
  t.push_back(scalar("VSS", "Vehicle Speed", 0x0D, 3, 0, 255, 1, K::Int, U::KilometersPerHour));
  t.push_back(scalar("CEL", "Engine Load", 0x04, 3, 0, 100, kPercentScaling, K::Percent, U::Percent));
  t.push_back(scalar("ECT", "Engine Coolant Temp", 0x05, 3, -40, 215, kTemperatureOffset,
                     K::Offset, U::DegreeCelsius));
  t.push_back(scalar("MAF", "Mass Air Flow", 0x10, 4, 0, 655.35, 0.01, K::Float, U::GramPerSecond));
  t.push_back(scalar("TP", "Throttle Position", 0x11, 3, 0, 100, kPercentScaling, K::Percent, U::Percent));
  t.push_back(scalar("TES", "Time since Engine Start", 0x1F, 4, 0, 65535, 1, K::Int, U::Second));
  t.push_back(scalar("DMA", "Distance MIL Active", 0x21, 4, 0, 65535, 1, K::Int, U::Kilometer));
  t.push_back(scalar("FRP", "Fuel Rail Pressure", 0x23, 4, 0, 655350, 10, K::Float, U::KiloPascal));
  t.push_back(scalar("FLI", "Fuel Level Input", 0x2F, 3, 0, 100, kPercentScaling, K::Percent, U::Percent));
  t.push_back(scalar("DDC", "Distance DTC Cleared", 0x31, 4, 0, 65535, 1, K::Int, U::Kilometer));
  t.push_back(scalar("ACE", "Air Commanded Equivalence Ratio", 0x44, 4, 0, 1.99, 1.0 / 32786.88,
                     K::Float, U::Ratio));
  t.push_back(scalar("RMA", "Engine Runtime MIL Active", 0x4D, 4, 0, 65535, 1, K::Int, U::Minute));
  t.push_back(scalar("RDA", "Engine Runtime DTC Active", 0x4E, 4, 0, 65535, 1, K::Int, U::Minute));
  t.push_back(scalar("FT", "Fuel Type", 0x51, 3, 0, 255, 1, K::Int, U::StateEncoded));
  t.push_back(scalar("EOT", "Engine Oil Temperature", 0x5C, 3, -40, 215, kTemperatureOffset,
                     K::Offset, U::DegreeCelsius));
  t.push_back(scalar("EFR", "Engine Fuel Rate", 0x5E, 4, 0, 3276.75, 0.05, K::Float, U::LiterPerHour));

  // Run time, idle time, PTO run time
  t.push_back(composite("ERT", "Engine Run Time", 0x7F, 15, {
    field(0, 4294967295.0, 1, K::Int, U::Second, 4),
    field(0, 4294967295.0, 1, K::Int, U::Second, 4),
    field(0, 4294967295.0, 1, K::Int, U::Second, 4)
  }));

  // DEF concentration, DEF temperature, DEF level
  t.push_back(composite("DEF", "Diesel Exhaust Fluid", 0x9B, 6, {
    field(0, 63.75, 0.25, K::Float, U::Percent, 1),
    field(-40, 215, kTemperatureOffset, K::Offset, U::DegreeCelsius, 1),
    field(0, 100, kPercentScaling, K::Percent, U::Percent, 1)
  }));

  t.push_back(scalar("FR", "Fuel Rate", 0x9D, 4, 0, 1310.7, 0.02, K::Float, U::GramPerSecond));
  t.push_back(scalar("ODO", "Odometer", 0xA6, 6, 0, 429496729.5, 0.1, K::Float, U::Kilometer));

  // 49 02 01 + 17 ASCII characters
  t.push_back(special("VIN", "VIN", Mode::VehicleInformation, 20));
  // Variable length: 43 <count> then two bytes per DTC
  t.push_back(special("DTC", "Active DTCs", Mode::StoredDTCs, 0));

  return t;
}

std::string to_upper(const std::string& s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return out;
}

} // namespace

// ============================================================================
// Registry API
// ============================================================================

const std::vector<Parameter>& parameters() {
  static const std::vector<Parameter> table = build_table();
  return table;
}

Result<Parameter> lookup(const std::string& code) {
  const std::string key = to_upper(code);
  for (const auto& p : parameters()) {
    if (p.code == key) {
      return Result<Parameter>::success(p);
    }
  }
  return Result<Parameter>::failure(ErrorCode::InvalidParameter, code);
}

Result<Parameter> lookup_pid(uint8_t pid) {
  for (const auto& p : parameters()) {
    if (p.mode == Mode::CurrentData && p.pid && *p.pid == pid) {
      return Result<Parameter>::success(p);
    }
  }

  std::ostringstream oss;
  oss << "0x" << std::hex << std::uppercase << std::setw(2) << std::setfill('0')
      << static_cast<int>(pid);
  return Result<Parameter>::failure(ErrorCode::InvalidParameter, oss.str());
}

bool is_known(const std::string& code) {
  return lookup(code).ok;
}

std::vector<std::string> parameter_codes() {
  std::vector<std::string> codes;
  codes.reserve(parameters().size());
  for (const auto& p : parameters()) {
    codes.push_back(p.code);
  }
  return codes;
}

// ============================================================================
// Helper Functions
// ============================================================================

const char* fuel_type_name(uint8_t raw) {
  switch (raw) {
    case 0:  return "None";
    case 1:  return "Gasoline";
    case 2:  return "Methanol";
    case 3:  return "Ethanol";
    case 4:  return "Diesel";
    case 6:  return "Natural Gas";
    case 8:  return "Electric";
    default: return "Unknown";
  }
}

const char* unit_name(Unit unit) {
  switch (unit) {
    case Unit::NoUnit:               return "No Unit";
    case Unit::Boolean:              return "Boolean";
    case Unit::StateEncoded:         return "State Encoded";
    case Unit::Ratio:                return "Ratio";
    case Unit::Percent:              return "Percent";
    case Unit::DegreeCelsius:        return "Degree Celsius";
    case Unit::KiloPascal:           return "Kilopascal";
    case Unit::KilometersPerHour:    return "Kilometers per Hour";
    case Unit::Kilometer:            return "Kilometer";
    case Unit::RevolutionsPerMinute: return "Revolutions per Minute";
    case Unit::Second:               return "Second";
    case Unit::Minute:               return "Minute";
    case Unit::GramPerSecond:        return "Gram per Second";
    case Unit::LiterPerHour:         return "Liter per Hour";
    default:                         return "Unknown";
  }
}

const char* unit_symbol(Unit unit) {
  switch (unit) {
    case Unit::Percent:              return "%";
    case Unit::DegreeCelsius:        return "°C";
    case Unit::KiloPascal:           return "kPa";
    case Unit::KilometersPerHour:    return "km/h";
    case Unit::Kilometer:            return "km";
    case Unit::RevolutionsPerMinute: return "rpm";
    case Unit::Second:               return "s";
    case Unit::Minute:               return "min";
    case Unit::GramPerSecond:        return "g/s";
    case Unit::LiterPerHour:         return "L/h";
    default:                         return "";
  }
}

const char* scaling_kind_name(ScalingKind kind) {
  switch (kind) {
    case ScalingKind::Int:     return "int";
    case ScalingKind::Percent: return "percent";
    case ScalingKind::Offset:  return "offset";
    case ScalingKind::Float:   return "float";
    default:                   return "unknown";
  }
}

} // namespace obd2
