#include "obd2_can.hpp"
#include <algorithm>
#include <cstdio>
#include <cstring>
#include <utility>

namespace obd2 {
namespace can {

// PCI types
static constexpr uint8_t PCI_SF = 0x0 << 4; // Single Frame
static constexpr uint8_t PCI_FF = 0x1 << 4; // First Frame
static constexpr uint8_t PCI_CF = 0x2 << 4; // Consecutive Frame
static constexpr uint8_t PCI_FC = 0x3 << 4; // Flow Control

static constexpr uint8_t FC_CTS = 0x00; // Continue To Send

static constexpr size_t kSingleFrameMax = 7;
static constexpr size_t kFirstFrameData = 6;
static constexpr size_t kConsecutiveData = 7;

static CanFrame blank_frame(uint32_t id, CanIdWidth width, uint8_t padding) {
  CanFrame f{};
  f.id = id;
  f.extended = (width == CanIdWidth::Extended);
  f.dlc = kFrameLength;
  f.data.fill(padding);
  return f;
}

// ============================================================================
// Identifiers
// ============================================================================

Result<CanIdWidth> validate_can_id(int width) {
  switch (width) {
    case 11: return Result<CanIdWidth>::success(CanIdWidth::Standard);
    case 29: return Result<CanIdWidth>::success(CanIdWidth::Extended);
    default:
      return Result<CanIdWidth>::failure(ErrorCode::InvalidCANID, std::to_string(width));
  }
}

uint32_t frame_id(CanIdWidth width, Direction direction) {
  return direction == Direction::Request ? request_id(width) : response_id(width);
}

// ============================================================================
// Segmentation
// ============================================================================

Result<std::vector<CanFrame>> segment(const Bytes& payload, CanIdWidth width,
                                      Direction direction, const FramingConfig& config) {
  const size_t len = payload.size();
  if (len == 0 || len > kMaxPayload) {
    return Result<std::vector<CanFrame>>::failure(ErrorCode::InvalidLength, std::to_string(len));
  }

  const uint32_t id = frame_id(width, direction);
  std::vector<CanFrame> frames;

  if (len <= kSingleFrameMax) {
    CanFrame f = blank_frame(id, width, config.padding);
    f.data[0] = uint8_t(PCI_SF | (len & 0x0F));
    std::memcpy(&f.data[1], payload.data(), len);
    frames.push_back(f);
    return Result<std::vector<CanFrame>>::success(frames);
  }

  // First Frame
  CanFrame ff = blank_frame(id, width, config.padding);
  ff.data[0] = uint8_t(PCI_FF | ((len >> 8) & 0x0F));
  ff.data[1] = uint8_t(len & 0xFF);
  std::memcpy(&ff.data[2], payload.data(), kFirstFrameData);
  frames.push_back(ff);

  // Consecutive frames
  size_t idx = kFirstFrameData;
  uint8_t sn = 1;
  while (idx < len) {
    CanFrame cf = blank_frame(id, width, config.padding);
    cf.data[0] = uint8_t(PCI_CF | (sn & 0x0F));
    const size_t chunk = std::min(kConsecutiveData, len - idx);
    std::memcpy(&cf.data[1], &payload[idx], chunk);
    idx += chunk;
    frames.push_back(cf);
    sn = (uint8_t)((sn + 1) & 0x0F);
  }

  return Result<std::vector<CanFrame>>::success(frames);
}

CanFrame flow_control_frame(CanIdWidth width, const FramingConfig& config) {
  const uint32_t id = width == CanIdWidth::Extended ? address::kPhysicalRequest29
                                                    : address::kPhysicalRequest11;
  CanFrame fc = blank_frame(id, width, config.padding);
  fc.data[0] = uint8_t(PCI_FC | FC_CTS);
  fc.data[1] = config.block_size;
  fc.data[2] = config.st_min;
  return fc;
}

std::string format_frame(const CanFrame& frame) {
  char id[16];
  std::snprintf(id, sizeof(id), frame.extended ? "%08X" : "%03X", frame.id);

  const size_t dlc = std::min<size_t>(frame.dlc, kFrameLength);
  Bytes data(frame.data.begin(), frame.data.begin() + dlc);

  std::string out = id;
  if (!data.empty()) {
    out += ' ';
    out += to_hex(data);
  }
  return out;
}

// ============================================================================
// Reassembly
// ============================================================================

Reassembler::Reassembler(CanIdWidth width, Direction direction, FramingConfig config)
  : rx_id_(frame_id(width, direction)),
    extended_(width == CanIdWidth::Extended),
    config_(std::move(config)) {}

void Reassembler::reset() {
  payload_.clear();
  error_ = Error{};
  expected_length_ = 0;
  expected_sn_ = 1;
  in_progress_ = false;
  done_ = false;
}

void Reassembler::log(const std::string& message) const {
  if (config_.log_callback) {
    config_.log_callback(message);
  }
}

Reassembler::Status Reassembler::fail(const CanFrame& frame, const std::string& reason) {
  const std::string text = format_frame(frame);
  log("ISO-TP: " + reason + ": " + text);

  payload_.clear();
  expected_length_ = 0;
  expected_sn_ = 1;
  in_progress_ = false;
  done_ = true;
  error_ = Error{ErrorCode::MalformedResponse, text};
  return Status::Error;
}

Reassembler::Status Reassembler::feed(const CanFrame& frame) {
  if (frame.id != rx_id_ || frame.extended != extended_) {
    log("ISO-TP: ignoring frame " + format_frame(frame));
    return Status::Ignored;
  }

  // A finished message stays readable until the next frame for us arrives
  if (done_) {
    reset();
  }

  const size_t dlc = std::min<size_t>(frame.dlc, kFrameLength);
  if (dlc == 0) {
    return fail(frame, "empty frame");
  }

  const uint8_t pci = frame.data[0] & 0xF0;

  if (pci == PCI_FC) {
    return Status::Ignored;
  }

  if (pci == PCI_SF) {
    const uint8_t len = frame.data[0] & 0x0F;
    if (len == 0 || len > kSingleFrameMax) {
      return fail(frame, "bad single frame length");
    }
    if (len + 1u > dlc) {
      return fail(frame, "frame shorter than PCI length");
    }
    if (in_progress_) {
      log("ISO-TP: single frame aborts message in progress");
    }
    payload_.assign(&frame.data[1], &frame.data[1] + len);
    in_progress_ = false;
    done_ = true;
    return Status::Complete;
  }

  if (pci == PCI_FF) {
    const size_t total = (size_t(frame.data[0] & 0x0F) << 8) | frame.data[1];
    if (total <= kSingleFrameMax) {
      return fail(frame, "bad first frame length");
    }
    if (dlc < kFrameLength) {
      return fail(frame, "frame shorter than PCI length");
    }
    if (in_progress_) {
      log("ISO-TP: first frame restarts message in progress");
    }
    payload_.clear();
    payload_.reserve(total);
    payload_.insert(payload_.end(), &frame.data[2], &frame.data[2] + kFirstFrameData);
    expected_length_ = total;
    expected_sn_ = 1;
    in_progress_ = true;
    return Status::InProgress;
  }

  if (pci == PCI_CF) {
    if (!in_progress_) {
      return fail(frame, "consecutive frame without first frame");
    }
    const uint8_t sn = frame.data[0] & 0x0F;
    if (sn != expected_sn_) {
      return fail(frame, "sequence number mismatch");
    }

    const size_t remaining = expected_length_ - payload_.size();
    const size_t chunk = std::min(kConsecutiveData, remaining);
    if (chunk + 1 > dlc) {
      return fail(frame, "frame shorter than PCI length");
    }
    payload_.insert(payload_.end(), &frame.data[1], &frame.data[1] + chunk);
    expected_sn_ = (uint8_t)((expected_sn_ + 1) & 0x0F);

    if (payload_.size() >= expected_length_) {
      in_progress_ = false;
      done_ = true;
      return Status::Complete;
    }
    return Status::InProgress;
  }

  return fail(frame, "unknown frame type");
}

} // namespace can
} // namespace obd2
