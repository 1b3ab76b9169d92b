#pragma once
/**
 * @file obd2_error.hpp
 * @brief Error codes reported by the OBD2 parameter registry and codecs
 *
 * Every failure carries the offending value as text so the caller (a GUI
 * form or a console tool) can show the user exactly what was rejected:
 *
 *   InvalidParameter   'NOPE' is an invalid parameter name.
 *   InvalidVIN         'SHORT' is an invalid VIN. VIN must contain 17 characters.
 *   InvalidDTC         'X0101' is an invalid DTC.
 *   InvalidCANID       '15' is an invalid CAN ID, must be 11 or 29
 *   InvalidScaling     'VIN' has no associated scaling unit.
 *
 * Errors never trigger a retry or a fallback inside the library; they are
 * returned to the caller through obd2::Result.
 */

#include <cstdint>
#include <string>

namespace obd2 {

// ============================================================================
// Error codes
// ============================================================================

enum class ErrorCode : uint8_t {
    None                = 0x00,  ///< Not an error, default state of a Result
    InvalidParameter    = 0x01,  ///< Unknown parameter code or PID
    InvalidVIN          = 0x02,  ///< VIN is not 17 characters
    InvalidDTC          = 0x03,  ///< DTC is not [PCBU][0-3][hex][hex][hex]
    InvalidCANID        = 0x04,  ///< CAN id width is not 11 or 29
    InvalidScaling      = 0x05,  ///< Parameter has no (or an unknown) scaling kind
    UnsupportedPidGroup = 0x06,  ///< Not one of 00/20/40/60/80/A0
    InvalidLength       = 0x07,  ///< Wrong number of data bytes
    ValueOutOfRange     = 0x08,  ///< Physical value outside [min, max]
    MalformedResponse   = 0x09   ///< Response payload or frame cannot be parsed
};

// ============================================================================
// Error category
// ============================================================================

enum class Category {
    UserInput,      // Value typed in by the user (code, VIN, DTC, CAN id)
    DeviceData,     // Bytes received from a vehicle or simulator
    None
};

// ============================================================================
// Error value
// ============================================================================

struct Error {
    ErrorCode code{ErrorCode::None};
    std::string value;              ///< Offending value, rendered as text

    /// Human-readable message, e.g. "'P01' is an invalid DTC."
    std::string message() const;

    /// Message prefixed with the error code name for logging
    std::string format_for_log() const;

    Category category() const;

    explicit operator bool() const { return code != ErrorCode::None; }
};

/// Enumerator name, e.g. "InvalidDTC"
const char* error_code_name(ErrorCode code);

/// Format an error message without building an Error
std::string format_error(ErrorCode code, const std::string& value);

} // namespace obd2
