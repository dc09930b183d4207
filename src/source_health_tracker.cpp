// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "depthfuse/health/source_health_tracker.hpp"

#include <spdlog/spdlog.h>

#include <cmath>

namespace depthfuse {

SourceHealthTracker::SourceHealthTracker(const config::SoftGate& cfg)
    : computer_(cfg) {}

const SourceHealthState& SourceHealthTracker::update(
    const std::string& source_id, double health) {
  if (!std::isfinite(health)) {
    spdlog::warn("[SourceHealth] Non-finite health for '{}', treating as 0",
                 source_id);
  }

  auto& state = states_[source_id];
  const auto before = state.mode();
  const bool first = !state.initialized;
  state = computer_.step(state, health);

  const auto after = state.mode();
  if (first) {
    spdlog::debug("[SourceHealth] Tracking '{}' (gate {:.3f})", source_id,
                  state.smoothed_gate);
  }
  if (after != before) {
    auto log_level = after == HealthMode::HardDisabled ? spdlog::level::warn
                                                       : spdlog::level::info;
    spdlog::log(log_level, "[SourceHealth] '{}' {} -> {}", source_id,
                toString(before), toString(after));
  }
  return state;
}

std::optional<SourceHealthState> SourceHealthTracker::state(
    const std::string& source_id) const {
  auto it = states_.find(source_id);
  if (it == states_.end()) return std::nullopt;
  return it->second;
}

double SourceHealthTracker::gate(const std::string& source_id) const {
  auto it = states_.find(source_id);
  return it == states_.end() ? 0.0 : it->second.smoothed_gate;
}

bool SourceHealthTracker::isHardDisabled(const std::string& source_id) const {
  auto it = states_.find(source_id);
  return it != states_.end() && it->second.hard_disabled;
}

void SourceHealthTracker::reset(const std::string& source_id) {
  states_.erase(source_id);
}

std::vector<std::string> SourceHealthTracker::sources() const {
  std::vector<std::string> ids;
  ids.reserve(states_.size());
  for (const auto& [id, state] : states_) ids.push_back(id);
  return ids;
}

}  // namespace depthfuse
