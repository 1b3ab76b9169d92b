#include "obd2_supported.hpp"
#include "obd2_registry.hpp"
#include "obd2_scaling.hpp"

namespace obd2 {
namespace supported {

namespace {

constexpr uint32_t kNextGroupBit = 0x00000001;

int hex_digit(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  return -1;
}

SupportedPidGroup make_group(uint8_t index) {
  SupportedPidGroup g;
  g.index = index;
  g.request_pid = static_cast<uint8_t>(index * kPidsPerGroup);
  g.first_pid = static_cast<uint8_t>(g.request_pid + 1);
  g.last_pid = static_cast<uint8_t>(g.request_pid + kPidsPerGroup);
  return g;
}

} // namespace

// ============================================================================
// Groups
// ============================================================================

const std::array<uint8_t, kGroupCount>& supported_pid_codes() {
  static const std::array<uint8_t, kGroupCount> codes = {0x00, 0x20, 0x40, 0x60, 0x80, 0xA0};
  return codes;
}

Result<SupportedPidGroup> supported_pid_group(const std::string& pid_code) {
  if (pid_code.length() != 2) {
    return Result<SupportedPidGroup>::failure(ErrorCode::UnsupportedPidGroup, pid_code);
  }

  const int high = hex_digit(pid_code[0]);
  const int low = hex_digit(pid_code[1]);
  if (high < 0 || low < 0) {
    return Result<SupportedPidGroup>::failure(ErrorCode::UnsupportedPidGroup, pid_code);
  }

  auto group = supported_pid_group(static_cast<uint8_t>((high << 4) | low));
  if (!group.ok) {
    // Report the code the way the caller wrote it
    return Result<SupportedPidGroup>::failure(ErrorCode::UnsupportedPidGroup, pid_code);
  }
  return group;
}

Result<SupportedPidGroup> supported_pid_group(uint8_t request_pid) {
  const auto& codes = supported_pid_codes();
  for (size_t i = 0; i < codes.size(); ++i) {
    if (codes[i] == request_pid) {
      return Result<SupportedPidGroup>::success(make_group(static_cast<uint8_t>(i)));
    }
  }
  return Result<SupportedPidGroup>::failure(ErrorCode::UnsupportedPidGroup,
                                            to_hex(Bytes{request_pid}));
}

Result<SupportedPidGroup> group_for_pid(uint8_t pid) {
  if (pid == 0) {
    return Result<SupportedPidGroup>::failure(ErrorCode::UnsupportedPidGroup, to_hex(Bytes{pid}));
  }

  const uint8_t index = static_cast<uint8_t>((pid - 1) / kPidsPerGroup);
  if (index >= kGroupCount) {
    return Result<SupportedPidGroup>::failure(ErrorCode::UnsupportedPidGroup, to_hex(Bytes{pid}));
  }
  return Result<SupportedPidGroup>::success(make_group(index));
}

// ============================================================================
// Bitmasks
// ============================================================================

Result<Masks> build_supported_masks(const std::vector<std::string>& codes) {
  Masks masks{};

  for (const auto& code : codes) {
    auto param = lookup(code);
    if (!param.ok) {
      return Result<Masks>::failure(param.error);
    }
    if (param.value.mode != Mode::CurrentData || !param.value.pid) {
      continue;
    }

    const uint8_t pid = *param.value.pid;
    auto group = group_for_pid(pid);
    if (!group.ok) {
      return Result<Masks>::failure(group.error);
    }

    masks[group.value.index] |= (1u << group.value.bit_offset(pid));

    // A scanner only asks for a group when every lower group points to it
    for (size_t i = 0; i < group.value.index; ++i) {
      masks[i] |= kNextGroupBit;
    }
  }

  return Result<Masks>::success(masks);
}

Result<std::vector<uint8_t>> decode_supported_pids(uint8_t request_pid, const Bytes& data) {
  auto group = supported_pid_group(request_pid);
  if (!group.ok) {
    return Result<std::vector<uint8_t>>::failure(group.error);
  }
  if (data.size() != 4) {
    return Result<std::vector<uint8_t>>::failure(ErrorCode::InvalidLength, to_hex(data));
  }

  const uint32_t mask = static_cast<uint32_t>(scaling::bytes_to_uint(data));
  std::vector<uint8_t> pids;
  for (int bit = kPidsPerGroup - 1; bit >= 0; --bit) {
    if (mask & (1u << bit)) {
      pids.push_back(static_cast<uint8_t>(request_pid + kPidsPerGroup - bit));
    }
  }
  return Result<std::vector<uint8_t>>::success(pids);
}

bool is_pid_supported(const Masks& masks, uint8_t pid) {
  auto group = group_for_pid(pid);
  if (!group.ok) {
    return false;
  }
  return (masks[group.value.index] >> group.value.bit_offset(pid)) & 1u;
}

} // namespace supported
} // namespace obd2
