#ifndef OBD2_DTC_HPP
#define OBD2_DTC_HPP

/**
 * @file obd2_dtc.hpp
 * @brief Diagnostic Trouble Codes - SAE J1979 Mode 03
 *
 * ============================================================================
 * DTC REFERENCE (SAE J2012)
 * ============================================================================
 *
 * Text form: 5 characters, e.g. "P0301"
 *   [0]   System letter: P=Powertrain, C=Chassis, B=Body, U=Network
 *   [1]   0-3
 *   [2-4] Hex digits
 *
 * Wire form: 2 bytes
 *   Byte 0: [system:2][digit1:2][digit2:4]
 *   Byte 1: [digit3:4][digit4:4]
 *
 *   "P0301" -> 03 01
 *   "C1234" -> 52 34
 *   "U3FFF" -> FF FF
 *
 * Mode 03 positive response (ISO 15765-4 layout):
 *   [0x43] [number of DTCs] [DTC1 hi] [DTC1 lo] [DTC2 hi] [DTC2 lo] ...
 *
 * Usage:
 * @code
 *   auto check = obd2::dtc::validate_dtc("P0101");
 *   if (!check.ok) {
 *     std::cerr << check.error.message() << "\n";
 *   }
 *
 *   auto payload = obd2::dtc::build_dtc_response({"P0301", "U0100"});
 *   // payload.value = 43 02 03 01 C1 00
 * @endcode
 */

#include "obd2.hpp"
#include <string>
#include <vector>

namespace obd2 {
namespace dtc {

constexpr size_t kDtcLength = 5;

// ============================================================================
// DTC System
// ============================================================================

enum class System : uint8_t {
  Powertrain = 0,  ///< 'P'
  Chassis    = 1,  ///< 'C'
  Body       = 2,  ///< 'B'
  Network    = 3   ///< 'U'
};

// ============================================================================
// Validation and codec
// ============================================================================

/**
 * Validate a DTC string
 *
 * Fails with InvalidDTC unless the code is 5 characters, starts with
 * P, C, B or U (either case), has 0-3 in position 1 and hex digits after.
 */
Result<void> validate_dtc(const std::string& code);

/**
 * Encode a DTC string into its 2-byte wire form
 */
Result<Bytes> encode_dtc(const std::string& code);

/**
 * Decode a 2-byte wire DTC, e.g. (0x03, 0x01) -> "P0301"
 */
std::string decode_dtc(uint8_t high, uint8_t low);

/**
 * Build a Mode 03 positive response payload for `codes`
 *
 * Every code is validated first; the first invalid one is reported.
 */
Result<Bytes> build_dtc_response(const std::vector<std::string>& codes);

/**
 * Parse a Mode 03 positive response payload
 *
 * 00 00 pairs are padding and skipped. Fails with MalformedResponse on a
 * wrong response SID or when fewer DTC bytes than announced are present.
 */
Result<std::vector<std::string>> parse_dtc_response(const Bytes& payload);

// ============================================================================
// Helper Functions
// ============================================================================

const char* system_name(System system);

/// System letter of a wire DTC high byte
System system_of(uint8_t high);

} // namespace dtc
} // namespace obd2

#endif // OBD2_DTC_HPP
