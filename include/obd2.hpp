#ifndef OBD2_HPP
#define OBD2_HPP

/**
 * @file obd2.hpp
 * @brief OBD2 (SAE J1979) core types shared by the registry and codecs
 *
 * ============================================================================
 * SAE J1979 / ISO 15031-5 QUICK REFERENCE
 * ============================================================================
 *
 * SERVICE MODES (J1979 Section 6):
 * - 0x01: Request current powertrain diagnostic data
 * - 0x03: Request emission-related diagnostic trouble codes
 * - 0x09: Request vehicle information (PID 0x02 = VIN)
 *
 * MESSAGE FORMAT:
 * - Request:  [Mode] [PID]
 * - Positive: [Mode+0x40] [PID] [Data A] [Data B] ...
 *
 * CAN ADDRESSING (ISO 15765-4):
 * - 11-bit: functional request 0x7DF, ECU #1 request 0x7E0, response 0x7E8
 * - 29-bit: functional request 0x18DB33F1, ECU #1 request 0x18DA33F1,
 *           response 0x18DAF133
 *
 * High-level layout:
 * 1) Service modes and CAN identifier width
 * 2) Addressing constants
 * 3) Result type
 */

#include <cstdint>
#include <string>
#include <vector>

#include "obd2_error.hpp"

namespace obd2 {

// ============================================================================
// 1) Service modes and CAN identifier width
// ============================================================================

/**
 * @brief J1979 service identifiers used by the registry
 *
 * Positive response mode = request mode + 0x40.
 */
enum class Mode : uint8_t {
  CurrentData        = 0x01,  ///< Mode 01 - current powertrain data
  StoredDTCs         = 0x03,  ///< Mode 03 - emission-related DTCs
  VehicleInformation = 0x09   ///< Mode 09 - vehicle information
};

constexpr uint8_t kPositiveResponseOffset = 0x40;

inline uint8_t positive_response(Mode mode) {
  return static_cast<uint8_t>(static_cast<uint8_t>(mode) + kPositiveResponseOffset);
}

inline bool is_positive_response(uint8_t sid_rx, Mode mode) {
  return sid_rx == positive_response(mode);
}

/**
 * @brief CAN identifier width in bits
 *
 * ISO 15765-4 allows OBD2 over 11-bit (standard) and 29-bit (extended)
 * identifiers. Use can::validate_can_id() to obtain one from user input.
 */
enum class CanIdWidth : uint8_t {
  Standard = 11,  ///< 11-bit identifiers
  Extended = 29   ///< 29-bit identifiers
};

// ============================================================================
// 2) Addressing constants (ISO 15765-4)
// ============================================================================

namespace address {
  constexpr uint32_t kFunctionalRequest11 = 0x7DF;       ///< Tester -> all ECUs
  constexpr uint32_t kPhysicalRequest11   = 0x7E0;       ///< Tester -> ECU #1
  constexpr uint32_t kEcuResponse11       = 0x7E8;       ///< ECU #1 -> tester
  constexpr uint32_t kFunctionalRequest29 = 0x18DB33F1;  ///< Tester -> all ECUs
  constexpr uint32_t kPhysicalRequest29   = 0x18DA33F1;  ///< Tester -> ECU #1
  constexpr uint32_t kEcuResponse29       = 0x18DAF133;  ///< ECU #1 -> tester
}

/// Request identifier for the given width
inline uint32_t request_id(CanIdWidth width) {
  return width == CanIdWidth::Extended ? address::kFunctionalRequest29
                                       : address::kFunctionalRequest11;
}

/// Response identifier for the given width
inline uint32_t response_id(CanIdWidth width) {
  return width == CanIdWidth::Extended ? address::kEcuResponse29
                                       : address::kEcuResponse11;
}

// ============================================================================
// 3) Result type
// ============================================================================

template<typename T>
struct Result {
  bool ok{false};
  T value{};
  Error error{};

  static Result success(const T& v) {
    Result r; r.ok = true; r.value = v; return r;
  }

  static Result failure(const Error& e) {
    Result r; r.ok = false; r.error = e; return r;
  }

  static Result failure(ErrorCode code, const std::string& value) {
    return failure(Error{code, value});
  }
};

template<>
struct Result<void> {
  bool ok{false};
  Error error{};

  static Result success() {
    Result r; r.ok = true; return r;
  }

  static Result failure(const Error& e) {
    Result r; r.ok = false; r.error = e; return r;
  }

  static Result failure(ErrorCode code, const std::string& value) {
    return failure(Error{code, value});
  }
};

using Bytes = std::vector<uint8_t>;

// ============================================================================
// Hex helpers
// ============================================================================

/// Render bytes as upper-case hex separated by spaces, e.g. "41 0C 2E E0"
std::string to_hex(const Bytes& bytes);

/**
 * Parse hex bytes; spaces, ':' and '-' separators are ignored
 *
 * @return Result with the bytes, or MalformedResponse for odd digit counts
 *         or non-hex characters
 */
Result<Bytes> parse_hex(const std::string& text);

} // namespace obd2

#endif // OBD2_HPP
