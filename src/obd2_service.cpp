#include "obd2_service.hpp"

namespace obd2 {
namespace service {

// Core builder: [mode | pid | data], mirrors the positive response layout
static Bytes frame_payload(uint8_t sid, uint8_t pid, const Bytes& data) {
  Bytes out;
  out.reserve(2 + data.size());
  out.push_back(sid);
  out.push_back(pid);
  out.insert(out.end(), data.begin(), data.end());
  return out;
}

Result<Bytes> build_request(const std::string& code) {
  auto param = lookup(code);
  if (!param.ok) {
    return Result<Bytes>::failure(param.error);
  }
  if (param.value.mode != Mode::CurrentData || !param.value.pid) {
    return Result<Bytes>::failure(ErrorCode::InvalidParameter, code);
  }

  return Result<Bytes>::success(
    Bytes{static_cast<uint8_t>(Mode::CurrentData), *param.value.pid});
}

Result<Bytes> build_response(const std::string& code, const std::vector<double>& values,
                             const scaling::EncodeOptions& options) {
  auto param = lookup(code);
  if (!param.ok) {
    return Result<Bytes>::failure(param.error);
  }
  if (param.value.mode != Mode::CurrentData || !param.value.pid) {
    return Result<Bytes>::failure(ErrorCode::InvalidParameter, code);
  }

  auto data = scaling::encode(param.value, values, options);
  if (!data.ok) {
    return Result<Bytes>::failure(data.error);
  }

  return Result<Bytes>::success(
    frame_payload(positive_response(Mode::CurrentData), *param.value.pid, data.value));
}

Result<Reading> parse_response(const Bytes& payload) {
  if (payload.size() < 2 || !is_positive_response(payload[0], Mode::CurrentData)) {
    return Result<Reading>::failure(ErrorCode::MalformedResponse, to_hex(payload));
  }

  auto param = lookup_pid(payload[1]);
  if (!param.ok) {
    return Result<Reading>::failure(param.error);
  }

  Reading reading;
  reading.parameter = param.value;
  reading.raw.assign(payload.begin() + 2, payload.end());

  auto values = scaling::scale(reading.parameter, reading.raw);
  if (!values.ok) {
    return Result<Reading>::failure(values.error);
  }
  reading.values = values.value;

  return Result<Reading>::success(reading);
}

Result<Bytes> build_supported_response(uint8_t request_pid, const supported::Masks& masks) {
  auto group = supported::supported_pid_group(request_pid);
  if (!group.ok) {
    return Result<Bytes>::failure(group.error);
  }

  const Bytes data = scaling::uint_to_bytes(masks[group.value.index], 4);
  return Result<Bytes>::success(
    frame_payload(positive_response(Mode::CurrentData), request_pid, data));
}

Result<std::vector<uint8_t>> parse_supported_response(const Bytes& payload) {
  if (payload.size() < 2 || !is_positive_response(payload[0], Mode::CurrentData)) {
    return Result<std::vector<uint8_t>>::failure(ErrorCode::MalformedResponse, to_hex(payload));
  }

  const Bytes data(payload.begin() + 2, payload.end());
  return supported::decode_supported_pids(payload[1], data);
}

} // namespace service
} // namespace obd2
