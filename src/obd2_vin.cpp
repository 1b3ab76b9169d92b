#include "obd2_vin.hpp"
#include <cctype>

namespace obd2 {
namespace vin {

namespace {
constexpr uint8_t kDataItems = 0x01;
constexpr size_t kHeaderLength = 3;  // 49 02 01
}

Result<void> validate_vin(const std::string& value) {
  if (value.length() != kVinLength) {
    return Result<void>::failure(ErrorCode::InvalidVIN, value);
  }
  return Result<void>::success();
}

Bytes build_vin_request() {
  return Bytes{static_cast<uint8_t>(Mode::VehicleInformation), kPidVin};
}

Result<Bytes> build_vin_response(const std::string& value) {
  auto check = validate_vin(value);
  if (!check.ok) {
    return Result<Bytes>::failure(check.error);
  }

  Bytes out;
  out.reserve(kHeaderLength + kVinLength);
  out.push_back(positive_response(Mode::VehicleInformation));
  out.push_back(kPidVin);
  out.push_back(kDataItems);
  for (char c : value) {
    out.push_back(static_cast<uint8_t>(c));
  }
  return Result<Bytes>::success(out);
}

Result<std::string> parse_vin_response(const Bytes& payload) {
  if (payload.size() < kHeaderLength ||
      !is_positive_response(payload[0], Mode::VehicleInformation) ||
      payload[1] != kPidVin) {
    return Result<std::string>::failure(ErrorCode::MalformedResponse, to_hex(payload));
  }

  std::string value;
  value.reserve(kVinLength);
  for (size_t i = kHeaderLength; i < payload.size(); ++i) {
    if (std::isprint(payload[i])) {
      value.push_back(static_cast<char>(payload[i]));
    }
  }

  auto check = validate_vin(value);
  if (!check.ok) {
    return Result<std::string>::failure(check.error);
  }
  return Result<std::string>::success(value);
}

} // namespace vin
} // namespace obd2
