// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef DEPTHFUSE_CONFIG_NOISE_MODEL_HPP
#define DEPTHFUSE_CONFIG_NOISE_MODEL_HPP

#include <map>
#include <string>

namespace depthfuse {

/**
 * @brief Per-source noise model parameters.
 *
 *   σ = max(sigma_floor, sigma_base × (d / d_ref)^alpha × (1 − beta × c_eff))
 *
 * Immutable once published; a calibration replaces the whole value.
 */
struct NoiseModelParameters {
  double sigma_base = 0.02;    ///< Noise at reference depth, zero confidence [m]
  double alpha = 1.5;          ///< Depth exponent
  double beta = 0.5;           ///< Confidence reduction factor
  double sigma_floor = 0.005;  ///< Lower bound on σ [m]
};

namespace config {

/// Noise model configuration (defaults + per-source overrides).
struct NoiseModel {
  double conf_floor = 0.1;       ///< Effective confidence lower bound
  double reference_depth = 2.0;  ///< d_ref [m]
  double min_depth = 1e-3;       ///< Depth clamp before the power law [m]
  NoiseModelParameters defaults;
  std::map<std::string, NoiseModelParameters> sources;
};

}  // namespace config
}  // namespace depthfuse

#endif  // DEPTHFUSE_CONFIG_NOISE_MODEL_HPP
