#include "obd2_dtc.hpp"
#include <cctype>

namespace obd2 {
namespace dtc {

namespace {

constexpr uint8_t kNoDtcPadding = 0x00;

int hex_digit(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  return -1;
}

int system_bits(char c) {
  switch (std::toupper(static_cast<unsigned char>(c))) {
    case 'P': return 0;
    case 'C': return 1;
    case 'B': return 2;
    case 'U': return 3;
    default:  return -1;
  }
}

} // namespace

// ============================================================================
// Validation and codec
// ============================================================================

Result<void> validate_dtc(const std::string& code) {
  if (code.length() != kDtcLength || system_bits(code[0]) < 0) {
    return Result<void>::failure(ErrorCode::InvalidDTC, code);
  }

  // Second character only has two bits on the wire
  const int d1 = hex_digit(code[1]);
  if (d1 < 0 || d1 > 3) {
    return Result<void>::failure(ErrorCode::InvalidDTC, code);
  }

  for (size_t i = 2; i < kDtcLength; ++i) {
    if (hex_digit(code[i]) < 0) {
      return Result<void>::failure(ErrorCode::InvalidDTC, code);
    }
  }

  return Result<void>::success();
}

Result<Bytes> encode_dtc(const std::string& code) {
  auto check = validate_dtc(code);
  if (!check.ok) {
    return Result<Bytes>::failure(check.error);
  }

  const int system = system_bits(code[0]);
  const int d1 = hex_digit(code[1]);
  const int d2 = hex_digit(code[2]);
  const int d3 = hex_digit(code[3]);
  const int d4 = hex_digit(code[4]);

  Bytes out;
  out.push_back(static_cast<uint8_t>((system << 6) | (d1 << 4) | d2));
  out.push_back(static_cast<uint8_t>((d3 << 4) | d4));
  return Result<Bytes>::success(out);
}

std::string decode_dtc(uint8_t high, uint8_t low) {
  static const char kSystems[] = {'P', 'C', 'B', 'U'};
  static const char kHex[] = "0123456789ABCDEF";

  std::string out;
  out.reserve(kDtcLength);
  out.push_back(kSystems[(high >> 6) & 0x03]);
  out.push_back(kHex[(high >> 4) & 0x03]);
  out.push_back(kHex[high & 0x0F]);
  out.push_back(kHex[(low >> 4) & 0x0F]);
  out.push_back(kHex[low & 0x0F]);
  return out;
}

// ============================================================================
// Mode 03 payloads
// ============================================================================

Result<Bytes> build_dtc_response(const std::vector<std::string>& codes) {
  if (codes.size() > 0xFF) {
    return Result<Bytes>::failure(ErrorCode::InvalidLength, std::to_string(codes.size()));
  }

  Bytes out;
  out.reserve(2 + codes.size() * 2);
  out.push_back(positive_response(Mode::StoredDTCs));
  out.push_back(static_cast<uint8_t>(codes.size()));

  for (const auto& code : codes) {
    auto encoded = encode_dtc(code);
    if (!encoded.ok) {
      return Result<Bytes>::failure(encoded.error);
    }
    out.insert(out.end(), encoded.value.begin(), encoded.value.end());
  }

  return Result<Bytes>::success(out);
}

Result<std::vector<std::string>> parse_dtc_response(const Bytes& payload) {
  if (payload.size() < 2 || !is_positive_response(payload[0], Mode::StoredDTCs)) {
    return Result<std::vector<std::string>>::failure(ErrorCode::MalformedResponse,
                                                     to_hex(payload));
  }

  const size_t count = payload[1];
  if (payload.size() < 2 + count * 2) {
    return Result<std::vector<std::string>>::failure(ErrorCode::MalformedResponse,
                                                     to_hex(payload));
  }

  std::vector<std::string> codes;
  codes.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    const uint8_t high = payload[2 + i * 2];
    const uint8_t low = payload[3 + i * 2];
    if (high == kNoDtcPadding && low == kNoDtcPadding) {
      continue;
    }
    codes.push_back(decode_dtc(high, low));
  }

  return Result<std::vector<std::string>>::success(codes);
}

// ============================================================================
// Helper Functions
// ============================================================================

const char* system_name(System system) {
  switch (system) {
    case System::Powertrain: return "Powertrain";
    case System::Chassis:    return "Chassis";
    case System::Body:       return "Body";
    case System::Network:    return "Network";
    default:                 return "Unknown";
  }
}

System system_of(uint8_t high) {
  return static_cast<System>((high >> 6) & 0x03);
}

} // namespace dtc
} // namespace obd2
