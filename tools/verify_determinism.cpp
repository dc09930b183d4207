// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * verify_determinism: Replay a recorded frame sequence through both
 * quantizer backends and check every determinism-key field bit for bit.
 *
 * Usage:
 *   ./verify_determinism config.yaml frames.yaml [runs]
 *
 * Example:
 *   ./verify_determinism config/default.yaml config/frames_example.yaml 100
 *
 * Exit code: 0 if all fields are identical, 1 on mismatch, 2 on error.
 */

#include <depthfuse/depthfuse.hpp>
#include <iostream>
#include <string>

using namespace depthfuse;

namespace {

std::string formatRaw(const std::optional<std::int64_t>& raw) {
  return raw ? std::to_string(*raw) : std::string("<missing>");
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 3) {
    std::cerr << "Usage: verify_determinism <config.yaml> <frames.yaml> [runs]\n"
              << "  runs: replays per backend (default: 100)\n";
    return 2;
  }

  const std::string config_path = argv[1];
  const std::string frames_path = argv[2];

  try {
    auto cfg = loadConfig(config_path);
    applyLogging(cfg.logging);

    std::size_t runs = 100;
    if (argc >= 4) runs = std::stoul(argv[3]);

    // Load
    std::cout << "Loading " << frames_path << " ..." << std::endl;
    auto frames = loadFrames(frames_path);
    std::cout << "  " << frames.size() << " frames" << std::endl;

    // Verify
    std::cout << "Verifying (" << runs << " runs, arithmetic + integer) ..."
              << std::endl;
    DeterminismVerifier verifier(cfg);
    auto report = verifier.verify(frames, runs);

    std::cout << "  " << report.fields_compared << " fields compared"
              << std::endl;
    if (!report.overflows.empty()) {
      std::cout << "  " << report.overflows.size()
                << " overflow(s) clamped:" << std::endl;
      for (const auto& o : report.overflows) {
        std::cout << "    frame " << o.frame_index << " " << o.field << " = "
                  << o.value << " -> " << o.clamped << std::endl;
      }
    }
    if (report.passed()) {
      std::cout << "PASS: all determinism-key fields bit-identical"
                << std::endl;
      return 0;
    }

    std::cout << "FAIL: " << report.mismatches.size() << " mismatch(es)"
              << std::endl;
    for (const auto& m : report.mismatches) {
      std::cout << "  run " << m.run << " frame " << m.frame << " ["
                << m.backend << "] " << m.field
                << ": expected " << formatRaw(m.expected) << ", got "
                << formatRaw(m.actual) << std::endl;
    }
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 2;
  }
}
