#ifndef OBD2_SERVICE_HPP
#define OBD2_SERVICE_HPP

/**
 * @file obd2_service.hpp
 * @brief Mode 01 (current data) request and response payloads
 *
 * Request:  [0x01] [PID]
 * Response: [0x41] [PID] [data bytes per the registry]
 *
 * Payloads are the bytes after ISO-TP reassembly; obd2_can.hpp turns them
 * into CAN frames and back.
 */

#include "obd2.hpp"
#include "obd2_registry.hpp"
#include "obd2_scaling.hpp"
#include "obd2_supported.hpp"
#include <string>
#include <vector>

namespace obd2 {
namespace service {

/**
 * @brief A decoded Mode 01 response
 */
struct Reading {
  Parameter parameter;          ///< Registry entry resolved from the PID
  std::vector<double> values;   ///< One physical value per field
  Bytes raw;                    ///< Data bytes as received
};

/**
 * Build the Mode 01 request payload for a parameter code
 *
 * @return 01 <pid>; InvalidParameter for unknown codes or codes without a
 *         Mode 01 PID (VIN, DTC)
 */
Result<Bytes> build_request(const std::string& code);

/**
 * Build the Mode 01 positive response payload carrying `values`
 */
Result<Bytes> build_response(const std::string& code, const std::vector<double>& values,
                             const scaling::EncodeOptions& options = {});

/**
 * Parse a Mode 01 positive response payload
 *
 * Fails with MalformedResponse on a wrong SID or a payload shorter than
 * two bytes, InvalidParameter on an unknown PID and InvalidLength when the
 * data bytes do not match the registry.
 */
Result<Reading> parse_response(const Bytes& payload);

/**
 * Build a supported-PID response payload: 41 <request_pid> A B C D
 */
Result<Bytes> build_supported_response(uint8_t request_pid, const supported::Masks& masks);

/**
 * Parse a supported-PID response payload into the PIDs it marks
 */
Result<std::vector<uint8_t>> parse_supported_response(const Bytes& payload);

} // namespace service
} // namespace obd2

#endif // OBD2_SERVICE_HPP
