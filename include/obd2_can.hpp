#ifndef OBD2_CAN_HPP
#define OBD2_CAN_HPP

/**
 * @file obd2_can.hpp
 * @brief OBD2 over CAN - identifiers and ISO-TP (ISO 15765-2) framing
 *
 * OBD2 over CAN (ISO 15765-4) always uses 8 byte frames; unused bytes are
 * padded. Payloads up to 7 bytes travel in one Single Frame, longer ones
 * (VIN, ERT, multi-DTC responses) in a First Frame plus Consecutive Frames.
 *
 * Frame Types (ISO 15765-2 Section 8.2):
 * - Single Frame (0x0):      [0x0N] [data...] where N = length
 * - First Frame (0x1):       [0x1L LL] [data...] where LLL = length (12 bits)
 * - Consecutive Frame (0x2): [0x2N] [data...] where N = sequence number
 * - Flow Control (0x3):      [0x30] [BS] [STmin]
 *
 * Examples (11-bit):
 *   7DF  02 01 0C 00 00 00 00 00   request RPM
 *   7E8  04 41 0C 2E E0 00 00 00   3000 rpm
 *
 *   7E8  10 14 49 02 01 31 48 47   VIN, first frame (20 bytes)
 *   7E0  30 00 00 00 00 00 00 00   flow control, continue to send
 *   7E8  21 43 4D 38 32 36 33 33   consecutive frame 1
 *   7E8  22 41 30 30 34 33 35 32   consecutive frame 2
 */

#include "obd2.hpp"
#include <array>
#include <functional>
#include <string>
#include <vector>

namespace obd2 {
namespace can {

// ============================================================================
// Identifiers
// ============================================================================

/**
 * Validate a CAN identifier width given as a number of bits
 *
 * @return Standard (11) or Extended (29); InvalidCANID otherwise
 */
Result<CanIdWidth> validate_can_id(int width);

enum class Direction : uint8_t {
  Request,   ///< Tester -> ECU
  Response   ///< ECU -> tester
};

/// CAN identifier for a width and direction (0x7DF/0x7E8, 0x18DB33F1/0x18DAF133)
uint32_t frame_id(CanIdWidth width, Direction direction);

// ============================================================================
// Frames and configuration
// ============================================================================

constexpr size_t kFrameLength = 8;
constexpr size_t kMaxPayload = 4095;  // 12-bit First Frame length

struct CanFrame {
  uint32_t id{0};                          ///< 11 or 29 bit identifier
  bool extended{false};                    ///< 29-bit identifier
  uint8_t dlc{kFrameLength};
  std::array<uint8_t, kFrameLength> data{};
};

struct FramingConfig {
  uint8_t padding{0x00};       // Filler for unused frame bytes
  uint8_t block_size{0};       // Flow Control BS (0 = no limit)
  uint8_t st_min{0};           // Flow Control STmin (ms)

  // Diagnostics from the reassembler (ignored frames, sequence errors)
  std::function<void(const std::string&)> log_callback;
};

// ============================================================================
// Segmentation
// ============================================================================

/**
 * Split a service payload into ISO-TP frames
 *
 * @param payload Service payload, e.g. 41 0C 2E E0
 * @param width 11 or 29 bit identifiers
 * @param direction Selects the request or response identifier
 * @return Frames in transmit order; InvalidLength for empty payloads or
 *         payloads over 4095 bytes
 */
Result<std::vector<CanFrame>> segment(const Bytes& payload, CanIdWidth width,
                                      Direction direction,
                                      const FramingConfig& config = {});

/**
 * Flow Control (Continue To Send) frame the tester answers a First Frame with
 *
 * Flow Control is addressed physically to ECU #1 (0x7E0, 0x18DA33F1).
 */
CanFrame flow_control_frame(CanIdWidth width, const FramingConfig& config = {});

/// Render a frame as "7E8 04 41 0C 2E E0 00 00 00"
std::string format_frame(const CanFrame& frame);

// ============================================================================
// Reassembly
// ============================================================================

/**
 * Collects ISO-TP frames for one identifier into a service payload
 *
 * Frames with another identifier or identifier width, and Flow Control
 * frames, are ignored. A frame whose DLC is shorter than its PCI says is an
 * error. After Complete or Error the next frame starts a new message.
 */
class Reassembler {
public:
  enum class Status {
    InProgress,   // First Frame or Consecutive Frame accepted, more to come
    Complete,     // payload() holds a full message
    Ignored,      // Frame not for this reassembler
    Error         // error() describes the rejected frame
  };

  Reassembler(CanIdWidth width, Direction direction, FramingConfig config = {});

  Status feed(const CanFrame& frame);

  /// True after a First Frame until the message completes
  bool awaiting_consecutive() const { return in_progress_; }

  const Bytes& payload() const { return payload_; }
  const Error& error() const { return error_; }

  void reset();

private:
  Status fail(const CanFrame& frame, const std::string& reason);
  void log(const std::string& message) const;

  uint32_t rx_id_;
  bool extended_;
  FramingConfig config_;

  Bytes payload_;
  Error error_{};
  size_t expected_length_{0};
  uint8_t expected_sn_{1};
  bool in_progress_{false};
  bool done_{false};
};

} // namespace can
} // namespace obd2

#endif // OBD2_CAN_HPP
