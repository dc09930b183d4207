// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * soft_gate.hpp
 *
 * Health → continuous gate with hysteresis, hard disable and smoothing.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef DEPTHFUSE_HEALTH_SOFT_GATE_HPP
#define DEPTHFUSE_HEALTH_SOFT_GATE_HPP

#include "depthfuse/config/soft_gate.hpp"

namespace depthfuse {

enum class HealthMode { Enabled, Disabled, HardDisabled };

const char* toString(HealthMode mode);

/**
 * @brief Per-source gate state.
 *
 * Counters count consecutive frames meeting the pending transition's
 * condition and reset to 0 whenever the condition is not met.
 */
struct SourceHealthState {
  double smoothed_gate = 0.0;      ///< [0, 1]
  bool hysteresis_enabled = true;  ///< Enabled / Disabled
  int transition_frame_count = 0;
  bool hard_disabled = false;
  int hard_disable_frame_count = 0;
  int recovery_frame_count = 0;  ///< Healthy frames while hard-disabled
  bool initialized = false;      ///< False until the first observation

  HealthMode mode() const {
    if (hard_disabled) return HealthMode::HardDisabled;
    return hysteresis_enabled ? HealthMode::Enabled : HealthMode::Disabled;
  }
};

/**
 * @brief Pure state transition (state, health) → state'.
 *
 * Per frame:
 *   1. Hard-disabled: count frames with health ≥ enter_threshold; after
 *      hard_disable.confirm_frames the source leaves hard-disable in the
 *      Disabled state with gate 0. Gate stays 0 meanwhile.
 *   2. health < hard_disable.threshold for confirm_frames → hard-disabled,
 *      gate forced to 0 without smoothing.
 *   3. Hysteresis: Enabled → Disabled after confirm_frames below
 *      exit_threshold, Disabled → Enabled after confirm_frames above
 *      enter_threshold.
 *   4. raw = clamp((h − h_lo)/(h_hi − h_lo), 0, 1); min(raw, leak) while
 *      Disabled.
 *   5. EMA smoothing; the first observation seeds the average.
 *
 * Non-finite health is treated as 0; health is clamped to [0, 1].
 */
class SoftGateComputer {
 public:
  explicit SoftGateComputer(const config::SoftGate& cfg = {}) : cfg_(cfg) {}

  SourceHealthState step(SourceHealthState state, double health) const;

  /// Linear health → gate mapping, no state.
  double rawGate(double health) const;

  const config::SoftGate& config() const { return cfg_; }

  static double sanitizeHealth(double health);

 private:
  config::SoftGate cfg_;
};

}  // namespace depthfuse

#endif  // DEPTHFUSE_HEALTH_SOFT_GATE_HPP
