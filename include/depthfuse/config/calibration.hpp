// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef DEPTHFUSE_CONFIG_CALIBRATION_HPP
#define DEPTHFUSE_CONFIG_CALIBRATION_HPP

#include <cstddef>

namespace depthfuse::config {

/// Closed parameter interval [min, max].
struct Range {
  double min = 0.0;
  double max = 0.0;
};

/// Robust (IRLS + Huber) noise model calibration.
struct Calibration {
  std::size_t min_samples = 10;
  double huber_delta = 0.05;             ///< Huber threshold δ [m]
  double learning_rate = 0.01;           ///< Gradient step size
  int max_iterations = 100;              ///< Iteration cap (also the deadline)
  double convergence_threshold = 1e-6;   ///< Stop when max |Δθ| falls below
  double outlier_mad_multiplier = 3.0;   ///< Outlier if deviation > k × MAD
  double max_outlier_rate = 0.3;         ///< Fit valid below this rate
  Range sigma_base_range{0.001, 0.1};
  Range alpha_range{0.5, 3.0};
  Range beta_range{0.0, 0.9};
};

}  // namespace depthfuse::config

#endif  // DEPTHFUSE_CONFIG_CALIBRATION_HPP
