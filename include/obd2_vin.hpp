#ifndef OBD2_VIN_HPP
#define OBD2_VIN_HPP

/*
  Vehicle Identification Number - SAE J1979 Mode 09 PID 02

  Positive response payload:
    [0x49] [0x02] [number of data items = 0x01] [17 ASCII characters]

  The 20 byte payload does not fit a single CAN frame and is sent as an
  ISO-TP First Frame plus two Consecutive Frames (see obd2_can.hpp).
*/

#include "obd2.hpp"
#include <string>

namespace obd2 {
namespace vin {

constexpr size_t kVinLength = 17;
constexpr uint8_t kPidVin = 0x02;

/**
 * Validate a VIN: any 17 character string is accepted
 *
 * @return InvalidVIN carrying the value when the length is not 17
 */
Result<void> validate_vin(const std::string& value);

/**
 * Build the Mode 09 request payload for the VIN: 09 02
 */
Bytes build_vin_request();

/**
 * Build the Mode 09 PID 02 positive response payload
 */
Result<Bytes> build_vin_response(const std::string& value);

/**
 * Parse a Mode 09 PID 02 positive response payload
 *
 * Non-printable bytes (padding) are dropped before the length check.
 */
Result<std::string> parse_vin_response(const Bytes& payload);

} // namespace vin
} // namespace obd2

#endif // OBD2_VIN_HPP
