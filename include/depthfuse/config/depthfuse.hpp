// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef DEPTHFUSE_CONFIG_DEPTHFUSE_HPP
#define DEPTHFUSE_CONFIG_DEPTHFUSE_HPP

#include <string>

namespace YAML {
class Node;
}

#include "depthfuse/config/calibration.hpp"
#include "depthfuse/config/noise_model.hpp"
#include "depthfuse/config/numerics.hpp"
#include "depthfuse/config/soft_gate.hpp"
#include "depthfuse/config/synchronizer.hpp"
#include "depthfuse/config/uncertainty.hpp"

namespace depthfuse {

namespace config {

/// spdlog level name: trace, debug, info, warn, error, critical, off.
struct Logging {
  std::string level = "info";
};

}  // namespace config

/// Fusion core configuration. One immutable value per session.
struct Config {
  config::SoftGate soft_gate;
  config::NoiseModel noise_model;
  config::Calibration calibration;
  config::Uncertainty uncertainty;
  config::Quantization quantization;
  config::Determinism determinism;
  config::Synchronizer synchronizer;
  config::Logging logging;
};

Config parseConfig(const YAML::Node& root);
Config loadConfig(const std::string& path);

/// Non-finite scalars and fatal inconsistencies throw std::invalid_argument;
/// out-of-range values are clamped with a warning.
void validateConfig(Config& cfg);

/// Apply the configured spdlog level.
void applyLogging(const config::Logging& cfg);

}  // namespace depthfuse

#endif  // DEPTHFUSE_CONFIG_DEPTHFUSE_HPP
