#include "obd2_can.hpp"
#include "obd2_dtc.hpp"
#include "obd2_service.hpp"
#include "obd2_supported.hpp"
#include "obd2_vin.hpp"
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

// Builds the response an ECU would send for a parameter and prints it as
// a service payload and as CAN frames.
//
//   obd2_encode RPM 3000
//   obd2_encode --can 29 --strict ECT 250
//   obd2_encode VIN 1HGCM82633A004352
//   obd2_encode DTC P0301 U0100
//   obd2_encode SUPPORTED RPM VSS ODO

namespace {

void usage(const char* prog) {
  std::cerr << "Usage: " << prog << " [--can 11|29] [--strict] <CODE> <value>...\n"
            << "       " << prog << " [--can 11|29] VIN <vin>\n"
            << "       " << prog << " [--can 11|29] DTC <dtc>...\n"
            << "       " << prog << " [--can 11|29] SUPPORTED <CODE>...\n\n"
            << "Codes:";
  for (const auto& code : obd2::parameter_codes()) {
    std::cerr << " " << code;
  }
  std::cerr << std::endl;
}

int report(const obd2::Error& error) {
  std::cerr << "Error: " << error.format_for_log() << std::endl;
  return 1;
}

int print_frames(const obd2::Bytes& payload, obd2::CanIdWidth width) {
  std::cout << "Payload: " << obd2::to_hex(payload) << std::endl;

  auto frames = obd2::can::segment(payload, width, obd2::can::Direction::Response);
  if (!frames.ok) {
    return report(frames.error);
  }

  std::cout << "Frames:" << std::endl;
  for (const auto& frame : frames.value) {
    std::cout << "  " << obd2::can::format_frame(frame) << std::endl;
  }
  if (frames.value.size() > 1) {
    std::cout << "  (tester answers the first frame with "
              << obd2::can::format_frame(obd2::can::flow_control_frame(width)) << ")"
              << std::endl;
  }
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  obd2::CanIdWidth width = obd2::CanIdWidth::Standard;
  obd2::scaling::EncodeOptions options;

  int i = 1;
  for (; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--can" && i + 1 < argc) {
      auto w = obd2::can::validate_can_id(std::atoi(argv[++i]));
      if (!w.ok) {
        return report(w.error);
      }
      width = w.value;
    } else if (arg == "--strict") {
      options.clamp = false;
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

  const std::string code = argv[i++];
  std::vector<std::string> args(argv + i, argv + argc);

  // ==========================================================================
  // Named special cases
  // ==========================================================================

  if (code == "VIN") {
    if (args.size() != 1) {
      usage(argv[0]);
      return 1;
    }
    auto payload = obd2::vin::build_vin_response(args[0]);
    if (!payload.ok) {
      return report(payload.error);
    }
    return print_frames(payload.value, width);
  }

  if (code == "DTC") {
    auto payload = obd2::dtc::build_dtc_response(args);
    if (!payload.ok) {
      return report(payload.error);
    }
    return print_frames(payload.value, width);
  }

  if (code == "SUPPORTED") {
    auto masks = obd2::supported::build_supported_masks(args);
    if (!masks.ok) {
      return report(masks.error);
    }
    for (uint8_t request_pid : obd2::supported::supported_pid_codes()) {
      auto payload = obd2::service::build_supported_response(request_pid, masks.value);
      if (!payload.ok) {
        return report(payload.error);
      }
      if (print_frames(payload.value, width) != 0) {
        return 1;
      }
    }
    return 0;
  }

  // ==========================================================================
  // Mode 01 parameters
  // ==========================================================================

  auto param = obd2::lookup(code);
  if (!param.ok) {
    return report(param.error);
  }

  std::vector<double> values;
  for (const auto& a : args) {
    char* end = nullptr;
    const double v = std::strtod(a.c_str(), &end);
    if (end == a.c_str() || *end != '\0') {
      std::cerr << "Error: '" << a << "' is not a number" << std::endl;
      return 1;
    }
    values.push_back(v);
  }

  auto payload = obd2::service::build_response(param.value.code, values, options);
  if (!payload.ok) {
    return report(payload.error);
  }

  auto clamped = obd2::scaling::clamp(param.value, values);
  if (clamped.ok) {
    std::cout << param.value.name << ": "
              << obd2::scaling::format_value(param.value, clamped.value) << std::endl;
  }
  return print_frames(payload.value, width);
}
