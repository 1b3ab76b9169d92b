#include "obd2_error.hpp"

namespace obd2 {

// ============================================================================
// Message strings
// ============================================================================

std::string format_error(ErrorCode code, const std::string& value) {
    const std::string quoted = "'" + value + "'";

    switch (code) {
        case ErrorCode::None:
            return "";
        case ErrorCode::InvalidParameter:
            return quoted + " is an invalid parameter name.";
        case ErrorCode::InvalidVIN:
            return quoted + " is an invalid VIN. VIN must contain 17 characters.";
        case ErrorCode::InvalidDTC:
            return quoted + " is an invalid DTC.";
        case ErrorCode::InvalidCANID:
            return quoted + " is an invalid CAN ID, must be 11 or 29";
        case ErrorCode::InvalidScaling:
            return quoted + " has no associated scaling unit.";
        case ErrorCode::UnsupportedPidGroup:
            return quoted + " is not a supported-PID request code.";
        case ErrorCode::InvalidLength:
            return quoted + " has an invalid data length.";
        case ErrorCode::ValueOutOfRange:
            return quoted + " is outside the parameter range.";
        case ErrorCode::MalformedResponse:
            return quoted + " is not a valid response.";
        default:
            return quoted + " caused an unknown error.";
    }
}

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:                return "None";
        case ErrorCode::InvalidParameter:    return "InvalidParameter";
        case ErrorCode::InvalidVIN:          return "InvalidVIN";
        case ErrorCode::InvalidDTC:          return "InvalidDTC";
        case ErrorCode::InvalidCANID:        return "InvalidCANID";
        case ErrorCode::InvalidScaling:      return "InvalidScaling";
        case ErrorCode::UnsupportedPidGroup: return "UnsupportedPidGroup";
        case ErrorCode::InvalidLength:       return "InvalidLength";
        case ErrorCode::ValueOutOfRange:     return "ValueOutOfRange";
        case ErrorCode::MalformedResponse:   return "MalformedResponse";
        default:                             return "Unknown";
    }
}

// ============================================================================
// Error members
// ============================================================================

std::string Error::message() const {
    return format_error(code, value);
}

std::string Error::format_for_log() const {
    return std::string(error_code_name(code)) + ": " + message();
}

Category Error::category() const {
    switch (code) {
        case ErrorCode::InvalidParameter:
        case ErrorCode::InvalidVIN:
        case ErrorCode::InvalidDTC:
        case ErrorCode::InvalidCANID:
        case ErrorCode::InvalidScaling:
        case ErrorCode::UnsupportedPidGroup:
        case ErrorCode::ValueOutOfRange:
            return Category::UserInput;

        case ErrorCode::InvalidLength:
        case ErrorCode::MalformedResponse:
            return Category::DeviceData;

        default:
            return Category::None;
    }
}

} // namespace obd2
