// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef DEPTHFUSE_CONFIG_UNCERTAINTY_HPP
#define DEPTHFUSE_CONFIG_UNCERTAINTY_HPP

#include <string>
#include <utility>
#include <vector>

namespace depthfuse::config {

/// Variance propagation and quality penalty.
struct Uncertainty {
  double rho_max = 0.3;      ///< Assumed upper bound on residual correlation
  double penalty_k = 2.0;    ///< penalty = 1 − k × σ_total
  double penalty_min = 0.5;  ///< Penalty lower clamp

  /// Variance sources sharing a root cause (combined by max, not sum).
  std::vector<std::pair<std::string, std::string>> correlated_pairs = {
      {"depth_variance", "source_disagreement_variance"}};
};

}  // namespace depthfuse::config

#endif  // DEPTHFUSE_CONFIG_UNCERTAINTY_HPP
