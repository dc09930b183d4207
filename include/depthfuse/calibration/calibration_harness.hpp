// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * calibration_harness.hpp
 *
 * Robust (IRLS + Huber) fit of per-source noise model parameters against
 * ground-truth depth.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef DEPTHFUSE_CALIBRATION_CALIBRATION_HARNESS_HPP
#define DEPTHFUSE_CALIBRATION_CALIBRATION_HARNESS_HPP

#include <cstddef>
#include <future>
#include <string>
#include <vector>

#include "depthfuse/calibration/calibration_store.hpp"
#include "depthfuse/config/calibration.hpp"
#include "depthfuse/noise/noise_model.hpp"

namespace depthfuse {

struct CalibrationResult {
  double sigma_base = 0.0;
  double alpha = 0.0;
  double beta = 0.0;
  double fit_quality_score = 0.0;  ///< 1 − min(2 × outlier_rate, 1)
  double outlier_rate = 0.0;       ///< outliers / samples
  double residual_mad = 0.0;       ///< MAD of final residuals [m]
  bool is_valid = false;           ///< outlier_rate < max_outlier_rate
  int iterations = 0;
  bool converged = false;
  std::size_t sample_count = 0;
  std::size_t outlier_count = 0;
};

/**
 * @brief Fits (sigma_base, alpha, beta) of a source's noise model.
 *
 * The model predicts the expected absolute error |depth − truth| by the raw
 * (unfloored) σ at the measured depth. Each iteration computes residuals
 * r = e − σ_raw, Huber weights w = min(1, δ/|r|) and takes a gradient step
 *
 *   θ ← clamp(θ + lr × Σ w·r·∂σ/∂θ / Σ w)
 *
 * until max |Δθ| < convergence_threshold or max_iterations. Outliers are
 * samples with |r − median(r)| > k × MAD(r) under the final parameters.
 *
 * Calibration runs off the fusion thread. A valid fit is published to the
 * NoiseModel by whole-table replacement and written through the optional
 * CalibrationStore.
 */
class CalibrationHarness {
 public:
  CalibrationHarness(NoiseModel::Ptr model, const config::Calibration& cfg = {},
                     CalibrationStore::Ptr store = nullptr);

  /**
   * @brief Fit starting from the source's current parameters.
   *
   * Samples with non-finite values or confidence ≤ 0 are skipped.
   *
   * @throws std::invalid_argument if input lengths differ
   * @throws InsufficientCalibrationData if fewer than min_samples remain
   */
  CalibrationResult fit(const std::vector<double>& depths,
                        const std::vector<double>& confidences,
                        const std::vector<double>& true_depths,
                        const std::string& source_id) const;

  /// Fit from explicit initial parameters (clamped into the valid ranges).
  CalibrationResult fit(const std::vector<double>& depths,
                        const std::vector<double>& confidences,
                        const std::vector<double>& true_depths,
                        const NoiseModelParameters& initial,
                        const std::string& source_id) const;

  /**
   * @brief Fit and, if valid, publish the parameters.
   *
   * Insufficient data or an invalid fit logs a warning and keeps the prior
   * parameters.
   *
   * @return true if new parameters were published
   */
  bool calibrate(const std::string& source_id,
                 const std::vector<double>& depths,
                 const std::vector<double>& confidences,
                 const std::vector<double>& true_depths);

  /// calibrate() on a background thread. Inputs and the harness are
  /// copied, so the future may outlive this object.
  std::future<bool> calibrateAsync(std::string source_id,
                                   std::vector<double> depths,
                                   std::vector<double> confidences,
                                   std::vector<double> true_depths);

  const config::Calibration& config() const { return cfg_; }
  const NoiseModel& noiseModel() const { return *model_; }

 private:
  NoiseModelParameters clampParameters(NoiseModelParameters params) const;

  NoiseModel::Ptr model_;
  config::Calibration cfg_;
  CalibrationStore::Ptr store_;
};

}  // namespace depthfuse

#endif  // DEPTHFUSE_CALIBRATION_CALIBRATION_HARNESS_HPP
