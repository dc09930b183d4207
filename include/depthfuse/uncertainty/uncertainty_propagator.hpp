// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * uncertainty_propagator.hpp
 *
 * Combination of named variance contributions with correlation handling.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef DEPTHFUSE_UNCERTAINTY_UNCERTAINTY_PROPAGATOR_HPP
#define DEPTHFUSE_UNCERTAINTY_UNCERTAINTY_PROPAGATOR_HPP

#include <map>
#include <set>
#include <string>
#include <vector>

#include "depthfuse/config/uncertainty.hpp"

namespace depthfuse {

struct UncertaintyEstimate {
  double total_variance = 0.0;
  double total_uncertainty = 0.0;  ///< sqrt(total_variance)
  double penalty = 1.0;            ///< Quality multiplier in [penalty_min, 1]
  double correlated_variance = 0.0;
  double independent_variance = 0.0;
};

/**
 * @brief Combines variance contributions into one total.
 *
 * Contributions registered as highly correlated (pairs sharing a member
 * form one group) are not independent evidence: each group contributes the
 * maximum of its members. The remaining contributions combine under a
 * bounded residual correlation ρ_max:
 *
 *   var_indep = Σ σᵢ² + 2 ρ_max Σ_{i<j} σᵢ σⱼ
 *
 * Iteration follows key order, so the result is deterministic.
 */
class UncertaintyPropagator {
 public:
  explicit UncertaintyPropagator(const config::Uncertainty& cfg = {});

  /// Negative or non-finite contributions count as 0 (with a warning).
  UncertaintyEstimate propagate(
      const std::map<std::string, double>& variances) const;

  /// clamp(1 − k × total_uncertainty, penalty_min, 1)
  double penalty(double total_uncertainty) const;

  void addCorrelatedPair(const std::string& a, const std::string& b);
  bool areCorrelated(const std::string& a, const std::string& b) const;

  /// Current correlated groups, each sorted, in order of their first member.
  std::vector<std::set<std::string>> correlatedGroups() const;

  const config::Uncertainty& config() const { return cfg_; }

 private:
  const std::string& root(const std::string& name) const;

  config::Uncertainty cfg_;
  std::map<std::string, std::string> parent_;  // union-find forest
};

}  // namespace depthfuse

#endif  // DEPTHFUSE_UNCERTAINTY_UNCERTAINTY_PROPAGATOR_HPP
