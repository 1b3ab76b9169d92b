#ifndef OBD2_SUPPORTED_HPP
#define OBD2_SUPPORTED_HPP

/*
  Supported PIDs - SAE J1979 Mode 01 PIDs 00, 20, 40, 60, 80, A0

  Each request code covers the 32 PIDs that follow it. The ECU answers with
  a 4 byte big-endian bitmask:

    bit (request_pid + 32 - pid) set  ->  pid is supported
    bit 0 set                         ->  next request code is supported

  Example: RPM (0x0C) and VSS (0x0D) supported
    41 00 00 18 00 00   (bits 20 and 19)

  Usage:
    auto masks = obd2::supported::build_supported_masks({"RPM", "ODO"});
    // masks.value[0] bit 0 and masks.value[4] bit 0 are set so a scanner
    // walks up to group A0 where ODO (0xA6) lives.
*/

#include "obd2.hpp"
#include <array>
#include <string>
#include <vector>

namespace obd2 {
namespace supported {

constexpr size_t kGroupCount = 6;
constexpr uint8_t kPidsPerGroup = 32;

using Masks = std::array<uint32_t, kGroupCount>;

// ============================================================================
// Groups
// ============================================================================

struct SupportedPidGroup {
  uint8_t request_pid{0};  // 0x00, 0x20, ... 0xA0
  uint8_t index{0};        // 0..5
  uint8_t first_pid{0};    // request_pid + 1
  uint8_t last_pid{0};     // request_pid + 32

  bool contains(uint8_t pid) const {
    return pid >= first_pid && pid <= last_pid;
  }

  /// Bit position of `pid` inside this group's mask
  uint8_t bit_offset(uint8_t pid) const {
    return static_cast<uint8_t>(request_pid + kPidsPerGroup - pid);
  }
};

/// The six request PIDs in ascending order
const std::array<uint8_t, kGroupCount>& supported_pid_codes();

/**
 * Group for a supported-PID request code given as hex text ("00", "a0")
 *
 * @return UnsupportedPidGroup for any other code
 */
Result<SupportedPidGroup> supported_pid_group(const std::string& pid_code);
Result<SupportedPidGroup> supported_pid_group(uint8_t request_pid);

/**
 * Group whose mask carries `pid` (0x01..0xC0)
 */
Result<SupportedPidGroup> group_for_pid(uint8_t pid);

// ============================================================================
// Bitmasks
// ============================================================================

/**
 * Build the six supported-PID masks for a set of parameter codes
 *
 * Codes without a Mode 01 PID (VIN, DTC) are ignored; unknown codes fail
 * with InvalidParameter.
 */
Result<Masks> build_supported_masks(const std::vector<std::string>& codes);

/**
 * Decode the 4 data bytes of a supported-PID response into PIDs
 */
Result<std::vector<uint8_t>> decode_supported_pids(uint8_t request_pid, const Bytes& data);

bool is_pid_supported(const Masks& masks, uint8_t pid);

} // namespace supported
} // namespace obd2

#endif // OBD2_SUPPORTED_HPP
