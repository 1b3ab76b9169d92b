#ifndef OBD2_REGISTRY_HPP
#define OBD2_REGISTRY_HPP

/*
  OBD2 Parameter Registry - SAE J1979 Mode 01 parameters

  A fixed table mapping short parameter codes ("RPM", "ECT", "MIL", ...)
  to everything needed to encode or decode them on the wire:

  - display name and raw PID
  - number of message bytes (mode + PID + data)
  - per-field bounds, scaling factor, scaling kind and unit

  Composite PIDs ("ERT", "DEF") carry three fields behind a leading
  support byte. "VIN" and "DTC" are named special cases without a Mode 01
  PID and without scaling.

  The table is built once on first use and never mutated, so any number
  of threads may read it.

  Usage:
    auto rpm = obd2::lookup("RPM");
    if (rpm.ok) {
      std::cout << rpm.value.name << " PID 0x" << std::hex << int(*rpm.value.pid);
    } else {
      std::cerr << rpm.error.message() << "\n";
    }
*/

#include "obd2.hpp"
#include <optional>
#include <string>
#include <vector>

namespace obd2 {

// ============================================================================
// Units
// ============================================================================

enum class Unit : uint8_t {
  NoUnit,
  Boolean,
  StateEncoded,
  Ratio,
  Percent,
  DegreeCelsius,
  KiloPascal,
  KilometersPerHour,
  Kilometer,
  RevolutionsPerMinute,
  Second,
  Minute,
  GramPerSecond,
  LiterPerHour
};

// ============================================================================
// Scaling kinds
// ============================================================================

/**
 * How raw bytes convert to the physical value:
 * - Int:     physical = raw * scaling
 * - Percent: physical = raw * scaling, scaling = 100/255
 * - Offset:  physical = raw - scaling
 * - Float:   physical = raw * scaling, fractional scaling
 */
enum class ScalingKind : uint8_t {
  Int,
  Percent,
  Offset,
  Float
};

// ============================================================================
// Parameter metadata
// ============================================================================

struct Field {
  double min_value{0.0};
  double max_value{0.0};
  double scaling{1.0};
  ScalingKind kind{ScalingKind::Int};
  Unit unit{Unit::NoUnit};
  uint8_t width{1};       // Data bytes used by this field
};

struct Parameter {
  std::string code;                 // Short code, e.g. "RPM"
  std::string name;                 // Display name, e.g. "Engine Coolant Temp"
  Mode mode{Mode::CurrentData};
  std::optional<uint8_t> pid;       // Absent for VIN and DTC
  uint8_t byte_count{0};            // Mode + PID + data bytes
  uint8_t support_byte{0};          // Leading data byte of composite PIDs, 0 if none
  std::vector<Field> fields;        // Empty for VIN and DTC

  bool has_scaling() const { return !fields.empty(); }
  bool is_composite() const { return fields.size() > 1; }

  /// Number of data bytes after mode and PID
  uint8_t data_bytes() const {
    return byte_count > 2 ? static_cast<uint8_t>(byte_count - 2) : 0;
  }
};

// ============================================================================
// Registry API
// ============================================================================

/**
 * Look up a parameter by its short code (case-insensitive)
 *
 * @param code Parameter code, e.g. "RPM"
 * @return Result with the parameter, or InvalidParameter
 */
Result<Parameter> lookup(const std::string& code);

/**
 * Look up a Mode 01 parameter by its raw PID
 *
 * @param pid Raw PID, e.g. 0x0C
 * @return Result with the parameter, or InvalidParameter ("0x0C")
 */
Result<Parameter> lookup_pid(uint8_t pid);

/// True if `code` names a registry entry
bool is_known(const std::string& code);

/// All registry entries in table order
const std::vector<Parameter>& parameters();

/// All parameter codes in table order
std::vector<std::string> parameter_codes();

// ============================================================================
// Helper Functions
// ============================================================================

/**
 * Fuel type state name for PID 0x51 (e.g. 4 -> "Diesel")
 * Returns "Unknown" for values without a defined state.
 */
const char* fuel_type_name(uint8_t raw);

const char* unit_name(Unit unit);

/// Unit symbol, e.g. "°C", "km/h"; empty for unitless values
const char* unit_symbol(Unit unit);

const char* scaling_kind_name(ScalingKind kind);

} // namespace obd2

#endif // OBD2_REGISTRY_HPP
