// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * noise_model.hpp
 *
 * Depth- and confidence-dependent per-source noise model with a floor.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef DEPTHFUSE_NOISE_NOISE_MODEL_HPP
#define DEPTHFUSE_NOISE_NOISE_MODEL_HPP

#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>

#include "depthfuse/config/noise_model.hpp"

namespace depthfuse {

class CalibrationStore;

/**
 * @brief Per-source depth noise σ.
 *
 *   c_eff = clamp(c, conf_floor, 1)
 *   σ_raw = sigma_base × (max(d, min_depth) / d_ref)^alpha × (1 − beta × c_eff)
 *   σ     = max(sigma_floor, σ_raw)
 *
 * The power law goes through det::pow so σ is bit-identical across
 * platforms. Samples with confidence ≤ 0 (or NaN) have no σ.
 *
 * **Thread-safe** (guarded by internal shared_mutex):
 * Parameters live in an immutable ParameterTable that calibration replaces
 * as a whole. A frame takes one snapshot() and evaluates every source
 * against it, so a concurrent calibration never mixes two tables within
 * one frame.
 */
class NoiseModel {
 public:
  using Ptr = std::shared_ptr<NoiseModel>;
  using ParameterTable = std::map<std::string, NoiseModelParameters>;

  explicit NoiseModel(const config::NoiseModel& cfg = {});

  /// σ for a source, using the current parameter table.
  std::optional<double> sigma(double depth, double confidence,
                              const std::string& source_id) const;

  /// σ for explicit parameters. Pure.
  std::optional<double> sigma(double depth, double confidence,
                              const NoiseModelParameters& params) const;

  /// σ_raw without the floor or the validity check.
  double rawSigma(double depth, double confidence,
                  const NoiseModelParameters& params) const;

  double effectiveConfidence(double confidence) const;

  /// Parameters for a source; the configured default for unknown sources.
  NoiseModelParameters parameters(const std::string& source_id) const;

  /// Parameter lookup within a snapshot.
  NoiseModelParameters parametersIn(const ParameterTable& table,
                                    const std::string& source_id) const;

  std::shared_ptr<const ParameterTable> snapshot() const;

  void replaceParameters(const std::string& source_id,
                         const NoiseModelParameters& params);
  void replaceAll(ParameterTable table);

  /**
   * @brief Seed parameters from persisted calibration.
   *
   * Stored (sigma_base, alpha, beta) replace the fitted parameters; each
   * source keeps its configured sigma_floor.
   *
   * @return Number of sources loaded
   */
  std::size_t loadFrom(const CalibrationStore& store);

  const config::NoiseModel& config() const { return cfg_; }

 private:
  config::NoiseModel cfg_;
  mutable std::shared_mutex mutex_;
  std::shared_ptr<const ParameterTable> table_;
};

}  // namespace depthfuse

#endif  // DEPTHFUSE_NOISE_NOISE_MODEL_HPP
