#include "obd2_can.hpp"
#include "obd2_dtc.hpp"
#include "obd2_service.hpp"
#include "obd2_supported.hpp"
#include "obd2_vin.hpp"
#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

// Decodes OBD2 responses given as hex, either as a reassembled service
// payload or as a sequence of 8 byte CAN frames from the ECU.
//
//   obd2_decode "41 0C 2E E0"
//   obd2_decode --frames "10 14 49 02 01 31 48 47" "21 43 4D 38 32 36 33 33" \
//                        "22 41 30 30 34 33 35 32"
//   obd2_decode --can 29 --frames "03 41 0D 58 00 00 00 00"

namespace {

void usage(const char* prog) {
  std::cerr << "Usage: " << prog << " <payload hex>\n"
            << "       " << prog << " [--can 11|29] --frames <frame hex>...\n";
}

int report(const obd2::Error& error) {
  std::cerr << "Error: " << error.format_for_log() << std::endl;
  return 1;
}

int decode_payload(const obd2::Bytes& payload) {
  if (payload.empty()) {
    return report(obd2::Error{obd2::ErrorCode::MalformedResponse, ""});
  }

  switch (payload[0]) {
    case 0x43: {
      auto codes = obd2::dtc::parse_dtc_response(payload);
      if (!codes.ok) {
        return report(codes.error);
      }
      std::cout << "Active DTCs: " << codes.value.size() << std::endl;
      for (const auto& code : codes.value) {
        auto encoded = obd2::dtc::encode_dtc(code);
        const char* system = encoded.ok
          ? obd2::dtc::system_name(obd2::dtc::system_of(encoded.value[0]))
          : "Unknown";
        std::cout << "  " << code << " (" << system << ")" << std::endl;
      }
      return 0;
    }

    case 0x49: {
      auto vin = obd2::vin::parse_vin_response(payload);
      if (!vin.ok) {
        return report(vin.error);
      }
      std::cout << "VIN: " << vin.value << std::endl;
      return 0;
    }

    default:
      break;
  }

  // Supported-PID requests share Mode 01 with regular parameters
  if (payload.size() >= 2 && obd2::supported::supported_pid_group(payload[1]).ok) {
    auto pids = obd2::service::parse_supported_response(payload);
    if (!pids.ok) {
      return report(pids.error);
    }
    std::cout << "Supported PIDs:";
    for (uint8_t pid : pids.value) {
      auto param = obd2::lookup_pid(pid);
      std::cout << " " << obd2::to_hex({pid});
      if (param.ok) {
        std::cout << "(" << param.value.code << ")";
      }
    }
    std::cout << std::endl;
    return 0;
  }

  auto reading = obd2::service::parse_response(payload);
  if (!reading.ok) {
    return report(reading.error);
  }
  std::cout << reading.value.parameter.name << " [" << reading.value.parameter.code << "]: "
            << obd2::scaling::format_value(reading.value.parameter, reading.value.values) << std::endl;
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  obd2::CanIdWidth width = obd2::CanIdWidth::Standard;
  bool frames = false;

  int i = 1;
  for (; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--can" && i + 1 < argc) {
      auto w = obd2::can::validate_can_id(std::atoi(argv[++i]));
      if (!w.ok) {
        return report(w.error);
      }
      width = w.value;
    } else if (arg == "--frames") {
      frames = true;
    } else if (arg == "-h" || arg == "--help") {
      usage(argv[0]);
      return 0;
    } else {
      break;
    }
  }

  if (i >= argc) {
    usage(argv[0]);
    return 1;
  }

  if (!frames) {
    std::string text;
    for (; i < argc; ++i) {
      text += argv[i];
      text += ' ';
    }
    auto payload = obd2::parse_hex(text);
    if (!payload.ok) {
      return report(payload.error);
    }
    return decode_payload(payload.value);
  }

  obd2::can::FramingConfig config;
  config.log_callback = [](const std::string& msg) {
    std::cerr << "[ISO-TP] " << msg << std::endl;
  };
  obd2::can::Reassembler rx(width, obd2::can::Direction::Response, config);

  for (; i < argc; ++i) {
    auto bytes = obd2::parse_hex(argv[i]);
    if (!bytes.ok) {
      return report(bytes.error);
    }
    if (bytes.value.empty() || bytes.value.size() > obd2::can::kFrameLength) {
      return report(obd2::Error{obd2::ErrorCode::InvalidLength, argv[i]});
    }

    obd2::can::CanFrame frame{};
    frame.id = obd2::response_id(width);
    frame.extended = (width == obd2::CanIdWidth::Extended);
    frame.dlc = static_cast<uint8_t>(bytes.value.size());
    std::copy(bytes.value.begin(), bytes.value.end(), frame.data.begin());

    switch (rx.feed(frame)) {
      case obd2::can::Reassembler::Status::Complete:
        std::cout << "Payload: " << obd2::to_hex(rx.payload()) << std::endl;
        if (decode_payload(rx.payload()) != 0) {
          return 1;
        }
        break;
      case obd2::can::Reassembler::Status::Error:
        return report(rx.error());
      case obd2::can::Reassembler::Status::InProgress:
        if (bytes.value[0] >> 4 == 0x1) {
          std::cout << "Flow control: "
                    << obd2::can::format_frame(obd2::can::flow_control_frame(width, config))
                    << std::endl;
        }
        break;
      case obd2::can::Reassembler::Status::Ignored:
        break;
    }
  }

  if (rx.awaiting_consecutive()) {
    std::cerr << "Error: message incomplete" << std::endl;
    return 1;
  }
  return 0;
}
