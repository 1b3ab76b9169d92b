#ifndef OBD2_SCALING_HPP
#define OBD2_SCALING_HPP

/*
  Mode 01 data scaling - raw response bytes <-> physical values

  Each registry field describes its conversion with a scaling kind and a
  factor (see obd2_registry.hpp):

    Int / Percent / Float : physical = raw * scaling
    Offset                : physical = raw - scaling

  Multi-byte fields are big-endian. Composite parameters (ERT, DEF) start
  with a support byte, followed by each field in order. MIL is reported in
  bit 7 of data byte A.

  Usage:
    // Coolant temperature: raw 0x28 -> 0 °C
    auto ect = obd2::scaling::scale("ECT", {0x28});
    if (ect.ok) {
      std::cout << obd2::scaling::format_value("ECT", ect.value).value << "\n";  // "0 °C"
    }

    // 3000 rpm -> 0x2E 0xE0
    auto raw = obd2::scaling::encode_value("RPM", 3000.0);
*/

#include "obd2.hpp"
#include "obd2_registry.hpp"
#include <string>
#include <vector>

namespace obd2 {
namespace scaling {

// ============================================================================
// Encoding options
// ============================================================================

struct EncodeOptions {
  bool clamp{true};  // Clamp to [min, max]; otherwise fail with ValueOutOfRange
};

// ============================================================================
// Byte Conversion Helpers
// ============================================================================

/**
 * Convert raw bytes to unsigned integer (big-endian, up to 8 bytes)
 */
uint64_t bytes_to_uint(const Bytes& bytes);

/**
 * Convert unsigned integer to `width` big-endian bytes
 */
Bytes uint_to_bytes(uint64_t value, size_t width);

// ============================================================================
// Scaling API
// ============================================================================

/**
 * Parse a scaling kind tag ("int", "percent", "offset", "float")
 *
 * @return Result with the kind, or InvalidScaling carrying the tag
 */
Result<ScalingKind> parse_scaling_kind(const std::string& tag);

/**
 * Apply a field's scaling to a raw integer
 */
double apply_scaling(uint64_t raw, const Field& field);

/**
 * Invert a field's scaling: the (unrounded) raw value for `physical`
 */
double invert_scaling(double physical, const Field& field);

/**
 * Decode response data bytes into physical values
 *
 * @param code Parameter code, e.g. "ECT"
 * @param raw Data bytes after mode and PID (A, B, ...)
 * @return One value per field; InvalidParameter, InvalidScaling or
 *         InvalidLength on failure
 */
Result<std::vector<double>> scale(const std::string& code, const Bytes& raw);
Result<std::vector<double>> scale(const Parameter& param, const Bytes& raw);

/**
 * Decode a single-field parameter (first field of a composite)
 */
Result<double> scale_value(const std::string& code, const Bytes& raw);

/**
 * Clamp values to each field's [min, max]
 *
 * Missing trailing values default to the field minimum. NaN and infinity
 * fail with ValueOutOfRange.
 */
Result<std::vector<double>> clamp(const std::string& code, const std::vector<double>& values);
Result<std::vector<double>> clamp(const Parameter& param, const std::vector<double>& values);

/**
 * Encode physical values into response data bytes (inverse of scale)
 *
 * @param code Parameter code
 * @param values One value per field; missing trailing values use the minimum
 * @param options Clamping behaviour
 * @return Data bytes, exactly Parameter::data_bytes() long
 */
Result<Bytes> encode(const std::string& code, const std::vector<double>& values,
                     const EncodeOptions& options = {});
Result<Bytes> encode(const Parameter& param, const std::vector<double>& values,
                     const EncodeOptions& options = {});

/**
 * Encode a single-field parameter
 */
Result<Bytes> encode_value(const std::string& code, double value,
                           const EncodeOptions& options = {});

// ============================================================================
// Helper Functions
// ============================================================================

/**
 * Format decoded values with their units
 *
 * @param precision Decimal places (-1 for auto by scaling kind)
 * @return e.g. "90 °C", "3000 rpm", "4 (Diesel)", "10.00 %, 20 °C, 50.2 %"
 */
std::string format_value(const Parameter& param, const std::vector<double>& values,
                         int precision = -1);
/// Same, by parameter code; fails with InvalidParameter for an unknown code
Result<std::string> format_value(const std::string& code, const std::vector<double>& values,
                                 int precision = -1);

} // namespace scaling
} // namespace obd2

#endif // OBD2_SCALING_HPP
