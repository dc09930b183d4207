// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "depthfuse/health/soft_gate.hpp"

#include <algorithm>
#include <cmath>

namespace depthfuse {

const char* toString(HealthMode mode) {
  switch (mode) {
    case HealthMode::Enabled:
      return "enabled";
    case HealthMode::Disabled:
      return "disabled";
    case HealthMode::HardDisabled:
      return "hard-disabled";
  }
  return "unknown";
}

double SoftGateComputer::sanitizeHealth(double health) {
  if (!std::isfinite(health)) return 0.0;
  return std::clamp(health, 0.0, 1.0);
}

double SoftGateComputer::rawGate(double health) const {
  const double h = sanitizeHealth(health);
  const double t = (h - cfg_.health_low) / (cfg_.health_high - cfg_.health_low);
  return std::clamp(t, 0.0, 1.0);
}

SourceHealthState SoftGateComputer::step(SourceHealthState s,
                                         double health) const {
  const double h = sanitizeHealth(health);
  const auto& hyst = cfg_.hysteresis;
  const auto& hard = cfg_.hard_disable;

  // 1. Hard-disabled: only sustained good health brings the source back
  if (s.hard_disabled) {
    s.recovery_frame_count = h >= hyst.enter_threshold
                                 ? s.recovery_frame_count + 1
                                 : 0;
    if (s.recovery_frame_count >= hard.confirm_frames) {
      s.hard_disabled = false;
      s.recovery_frame_count = 0;
      s.hard_disable_frame_count = 0;
      s.hysteresis_enabled = false;
      s.transition_frame_count = 0;
    }
    s.smoothed_gate = 0.0;
    s.initialized = true;
    return s;
  }

  // 2. Hard disable
  s.hard_disable_frame_count =
      h < hard.threshold ? s.hard_disable_frame_count + 1 : 0;
  if (s.hard_disable_frame_count >= hard.confirm_frames) {
    s.hard_disabled = true;
    s.hard_disable_frame_count = 0;
    s.recovery_frame_count = 0;
    s.hysteresis_enabled = false;
    s.transition_frame_count = 0;
    s.smoothed_gate = 0.0;
    s.initialized = true;
    return s;
  }

  // 3. Hysteresis
  const bool leaving = s.hysteresis_enabled ? h < hyst.exit_threshold
                                            : h > hyst.enter_threshold;
  s.transition_frame_count = leaving ? s.transition_frame_count + 1 : 0;
  if (s.transition_frame_count >= hyst.confirm_frames) {
    s.hysteresis_enabled = !s.hysteresis_enabled;
    s.transition_frame_count = 0;
  }

  // 4. Gate mapping
  double gated = rawGate(h);
  if (!s.hysteresis_enabled) gated = std::min(gated, cfg_.disabled_leak);

  // 5. Smoothing
  const double a = cfg_.smoothing_alpha;
  const double smoothed =
      s.initialized ? a * gated + (1.0 - a) * s.smoothed_gate : gated;
  s.smoothed_gate = std::clamp(smoothed, 0.0, 1.0);
  s.initialized = true;
  return s;
}

}  // namespace depthfuse
