#include "obd2_scaling.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace obd2 {
namespace scaling {

namespace {

constexpr uint8_t kPidMonitorStatus = 0x01;  // MIL lives in bit 7 of byte A
constexpr uint8_t kMilOnBit = 0x80;

bool is_monitor_status(const Parameter& p) {
  return p.mode == Mode::CurrentData && p.pid && *p.pid == kPidMonitorStatus;
}

uint64_t max_raw(uint8_t width) {
  return width >= 8 ? UINT64_MAX : ((1ULL << (width * 8)) - 1);
}

std::string describe_value(const Parameter& p, double value) {
  std::ostringstream oss;
  oss << p.code << "=" << value;
  return oss.str();
}

int auto_precision(ScalingKind kind) {
  switch (kind) {
    case ScalingKind::Percent: return 1;
    case ScalingKind::Float:   return 2;
    default:                   return 0;
  }
}

} // namespace

// ============================================================================
// Byte Conversion Helpers
// ============================================================================

uint64_t bytes_to_uint(const Bytes& bytes) {
  uint64_t result = 0;
  for (size_t i = 0; i < bytes.size() && i < 8; ++i) {
    result = (result << 8) | bytes[i];
  }
  return result;
}

Bytes uint_to_bytes(uint64_t value, size_t width) {
  Bytes out(width, 0);
  for (size_t i = 0; i < width && i < 8; ++i) {
    out[width - 1 - i] = static_cast<uint8_t>((value >> (8 * i)) & 0xFF);
  }
  return out;
}

// ============================================================================
// Scaling kinds
// ============================================================================

Result<ScalingKind> parse_scaling_kind(const std::string& tag) {
  std::string t(tag);
  std::transform(t.begin(), t.end(), t.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (t == "int")     return Result<ScalingKind>::success(ScalingKind::Int);
  if (t == "percent") return Result<ScalingKind>::success(ScalingKind::Percent);
  if (t == "offset")  return Result<ScalingKind>::success(ScalingKind::Offset);
  if (t == "float")   return Result<ScalingKind>::success(ScalingKind::Float);

  return Result<ScalingKind>::failure(ErrorCode::InvalidScaling, tag);
}

double apply_scaling(uint64_t raw, const Field& field) {
  const double r = static_cast<double>(raw);
  if (field.kind == ScalingKind::Offset) {
    return r - field.scaling;
  }
  return r * field.scaling;
}

double invert_scaling(double physical, const Field& field) {
  if (field.kind == ScalingKind::Offset) {
    return physical + field.scaling;
  }
  return physical / field.scaling;
}

// ============================================================================
// Decoding
// ============================================================================

Result<std::vector<double>> scale(const std::string& code, const Bytes& raw) {
  auto param = lookup(code);
  if (!param.ok) {
    return Result<std::vector<double>>::failure(param.error);
  }
  return scale(param.value, raw);
}

Result<std::vector<double>> scale(const Parameter& param, const Bytes& raw) {
  if (!param.has_scaling()) {
    return Result<std::vector<double>>::failure(ErrorCode::InvalidScaling, param.code);
  }
  if (raw.size() != param.data_bytes()) {
    return Result<std::vector<double>>::failure(ErrorCode::InvalidLength, param.code);
  }

  std::vector<double> values;
  values.reserve(param.fields.size());

  if (is_monitor_status(param)) {
    values.push_back((raw[0] & kMilOnBit) ? 1.0 : 0.0);
    return Result<std::vector<double>>::success(values);
  }

  size_t offset = param.is_composite() ? 1 : 0;  // Skip support byte
  for (const auto& f : param.fields) {
    Bytes chunk(raw.begin() + offset, raw.begin() + offset + f.width);
    values.push_back(apply_scaling(bytes_to_uint(chunk), f));
    offset += f.width;
  }

  return Result<std::vector<double>>::success(values);
}

Result<double> scale_value(const std::string& code, const Bytes& raw) {
  auto values = scale(code, raw);
  if (!values.ok) {
    return Result<double>::failure(values.error);
  }
  return Result<double>::success(values.value.front());
}

// ============================================================================
// Encoding
// ============================================================================

Result<std::vector<double>> clamp(const std::string& code, const std::vector<double>& values) {
  auto param = lookup(code);
  if (!param.ok) {
    return Result<std::vector<double>>::failure(param.error);
  }
  return clamp(param.value, values);
}

Result<std::vector<double>> clamp(const Parameter& param, const std::vector<double>& values) {
  if (!param.has_scaling()) {
    return Result<std::vector<double>>::failure(ErrorCode::InvalidScaling, param.code);
  }
  if (values.size() > param.fields.size()) {
    return Result<std::vector<double>>::failure(ErrorCode::InvalidLength, param.code);
  }

  std::vector<double> out;
  out.reserve(param.fields.size());
  for (size_t i = 0; i < param.fields.size(); ++i) {
    const Field& f = param.fields[i];
    if (i >= values.size()) {
      out.push_back(f.min_value);
    } else if (!std::isfinite(values[i])) {
      return Result<std::vector<double>>::failure(ErrorCode::ValueOutOfRange,
                                                  describe_value(param, values[i]));
    } else {
      out.push_back(std::min(std::max(values[i], f.min_value), f.max_value));
    }
  }
  return Result<std::vector<double>>::success(out);
}

Result<Bytes> encode(const std::string& code, const std::vector<double>& values,
                     const EncodeOptions& options) {
  auto param = lookup(code);
  if (!param.ok) {
    return Result<Bytes>::failure(param.error);
  }
  return encode(param.value, values, options);
}

Result<Bytes> encode(const Parameter& param, const std::vector<double>& values,
                     const EncodeOptions& options) {
  if (!options.clamp) {
    for (size_t i = 0; i < values.size() && i < param.fields.size(); ++i) {
      const Field& f = param.fields[i];
      if (!std::isfinite(values[i]) || values[i] < f.min_value || values[i] > f.max_value) {
        return Result<Bytes>::failure(ErrorCode::ValueOutOfRange,
                                      describe_value(param, values[i]));
      }
    }
  }

  auto clamped = clamp(param, values);
  if (!clamped.ok) {
    return Result<Bytes>::failure(clamped.error);
  }

  Bytes out;
  out.reserve(param.data_bytes());

  if (is_monitor_status(param)) {
    out.assign(param.data_bytes(), 0x00);
    if (clamped.value.front() > 0) {
      out[0] = kMilOnBit;
    }
    return Result<Bytes>::success(out);
  }

  if (param.is_composite()) {
    out.push_back(param.support_byte);
  }

  for (size_t i = 0; i < param.fields.size(); ++i) {
    const Field& f = param.fields[i];
    const long long raw = std::llround(invert_scaling(clamped.value[i], f));
    const uint64_t limit = max_raw(f.width);
    uint64_t r = 0;
    if (raw > 0) {
      r = std::min(static_cast<uint64_t>(raw), limit);
    }

    // Rounding must not step outside [min, max] (ACE: 1.99 -> 65246 -> 1.99003)
    const double tolerance = std::fabs(f.scaling) * 1e-9;
    if (r > 0 && apply_scaling(r, f) > f.max_value + tolerance) {
      --r;
    }
    if (r < limit && apply_scaling(r, f) < f.min_value - tolerance) {
      ++r;
    }
    Bytes chunk = uint_to_bytes(r, f.width);
    out.insert(out.end(), chunk.begin(), chunk.end());
  }

  return Result<Bytes>::success(out);
}

Result<Bytes> encode_value(const std::string& code, double value, const EncodeOptions& options) {
  return encode(code, std::vector<double>{value}, options);
}

// ============================================================================
// Helper Functions
// ============================================================================

std::string format_value(const Parameter& param, const std::vector<double>& values,
                         int precision) {
  std::ostringstream oss;

  for (size_t i = 0; i < values.size() && i < param.fields.size(); ++i) {
    const Field& f = param.fields[i];
    if (i > 0) oss << ", ";

    if (f.unit == Unit::Boolean) {
      oss << (values[i] > 0 ? "On" : "Off");
      continue;
    }

    const int digits = precision < 0 ? auto_precision(f.kind) : precision;
    oss << std::fixed << std::setprecision(digits) << values[i];

    if (f.unit == Unit::StateEncoded) {
      const bool in_byte = values[i] >= 0.0 && values[i] <= 255.0;  // false for NaN
      oss << " (" << (in_byte ? fuel_type_name(static_cast<uint8_t>(values[i])) : "Unknown")
          << ")";
      continue;
    }

    const char* symbol = unit_symbol(f.unit);
    if (symbol[0] != '\0') {
      oss << " " << symbol;
    }
  }

  return oss.str();
}

Result<std::string> format_value(const std::string& code, const std::vector<double>& values,
                                 int precision) {
  auto param = lookup(code);
  if (!param.ok) {
    return Result<std::string>::failure(param.error);
  }
  return Result<std::string>::success(format_value(param.value, values, precision));
}

} // namespace scaling
} // namespace obd2
