#include "obd2.hpp"
#include <cctype>
#include <iomanip>
#include <sstream>

namespace obd2 {

std::string to_hex(const Bytes& bytes) {
  std::ostringstream oss;
  for (size_t i = 0; i < bytes.size(); ++i) {
    if (i > 0) oss << ' ';
    oss << std::hex << std::uppercase << std::setw(2) << std::setfill('0')
        << static_cast<int>(bytes[i]);
  }
  return oss.str();
}

Result<Bytes> parse_hex(const std::string& text) {
  Bytes out;
  int high = -1;

  for (char c : text) {
    if (c == ' ' || c == ':' || c == '-' || c == '\t') continue;

    int digit = 0;
    if (c >= '0' && c <= '9') digit = c - '0';
    else if (c >= 'A' && c <= 'F') digit = c - 'A' + 10;
    else if (c >= 'a' && c <= 'f') digit = c - 'a' + 10;
    else return Result<Bytes>::failure(ErrorCode::MalformedResponse, text);

    if (high < 0) {
      high = digit;
    } else {
      out.push_back(static_cast<uint8_t>((high << 4) | digit));
      high = -1;
    }
  }

  if (high >= 0) {
    return Result<Bytes>::failure(ErrorCode::MalformedResponse, text);
  }
  return Result<Bytes>::success(out);
}

} // namespace obd2
