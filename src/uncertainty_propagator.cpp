// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "depthfuse/uncertainty/uncertainty_propagator.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <utility>

#include "depthfuse/numerics/deterministic_math.hpp"

namespace depthfuse {

UncertaintyPropagator::UncertaintyPropagator(const config::Uncertainty& cfg)
    : cfg_(cfg) {
  for (const auto& [a, b] : cfg_.correlated_pairs) addCorrelatedPair(a, b);
}

const std::string& UncertaintyPropagator::root(const std::string& name) const {
  const std::string* current = &name;
  auto it = parent_.find(*current);
  while (it != parent_.end() && it->second != *current) {
    current = &it->second;
    it = parent_.find(*current);
  }
  return it == parent_.end() ? name : it->first;
}

void UncertaintyPropagator::addCorrelatedPair(const std::string& a,
                                              const std::string& b) {
  parent_.emplace(a, a);
  parent_.emplace(b, b);
  const std::string ra = root(a);
  const std::string rb = root(b);
  if (ra == rb) return;
  // Smaller name becomes the root so groups do not depend on insertion order
  if (ra < rb) {
    parent_[rb] = ra;
  } else {
    parent_[ra] = rb;
  }
}

bool UncertaintyPropagator::areCorrelated(const std::string& a,
                                          const std::string& b) const {
  if (a == b) return parent_.count(a) > 0;
  if (!parent_.count(a) || !parent_.count(b)) return false;
  return root(a) == root(b);
}

std::vector<std::set<std::string>> UncertaintyPropagator::correlatedGroups()
    const {
  std::map<std::string, std::set<std::string>> by_root;
  for (const auto& [name, parent] : parent_) by_root[root(name)].insert(name);

  std::vector<std::set<std::string>> groups;
  groups.reserve(by_root.size());
  for (auto& [r, members] : by_root) groups.push_back(std::move(members));
  return groups;
}

double UncertaintyPropagator::penalty(double total_uncertainty) const {
  return std::clamp(1.0 - cfg_.penalty_k * total_uncertainty, cfg_.penalty_min,
                    1.0);
}

UncertaintyEstimate UncertaintyPropagator::propagate(
    const std::map<std::string, double>& variances) const {
  std::map<std::string, double> group_max;
  std::vector<double> independent_sigmas;
  double independent_sum = 0.0;

  for (const auto& [name, value] : variances) {
    double var = value;
    if (!std::isfinite(var) || var < 0.0) {
      spdlog::warn("[Uncertainty] Invalid variance '{}' ({}), using 0", name,
                   value);
      var = 0.0;
    }

    if (parent_.count(name)) {
      auto& m = group_max[root(name)];
      m = std::max(m, var);
    } else {
      independent_sum += var;
      independent_sigmas.push_back(det::sqrt(var));
    }
  }

  double cross = 0.0;
  for (std::size_t i = 0; i < independent_sigmas.size(); ++i) {
    for (std::size_t j = i + 1; j < independent_sigmas.size(); ++j) {
      cross += independent_sigmas[i] * independent_sigmas[j];
    }
  }

  UncertaintyEstimate est;
  for (const auto& [r, m] : group_max) est.correlated_variance += m;
  est.independent_variance = independent_sum + 2.0 * cfg_.rho_max * cross;
  est.total_variance = est.correlated_variance + est.independent_variance;
  est.total_uncertainty = det::sqrt(est.total_variance);
  est.penalty = penalty(est.total_uncertainty);
  return est;
}

}  // namespace depthfuse
