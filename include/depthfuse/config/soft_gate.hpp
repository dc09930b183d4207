// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * soft_gate.hpp
 *
 * Soft gate configuration: health mapping, hysteresis, hard disable.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef DEPTHFUSE_CONFIG_SOFT_GATE_HPP
#define DEPTHFUSE_CONFIG_SOFT_GATE_HPP

namespace depthfuse::config {

/**
 * @brief Dual-threshold Enabled/Disabled switching.
 *
 * enter_threshold must be strictly greater than exit_threshold so that
 * health values between the two never change the state.
 */
struct Hysteresis {
  double enter_threshold = 0.35;  ///< Disabled → Enabled above this
  double exit_threshold = 0.25;   ///< Enabled → Disabled below this
  int confirm_frames = 5;         ///< Consecutive frames to confirm
};

/// Sticky zero-gate for persistently broken sources.
struct HardDisable {
  double threshold = 0.1;  ///< Health below this counts towards disable
  int confirm_frames = 5;  ///< Consecutive frames to disable (and recover)
};

/// Health → gate mapping and smoothing.
struct SoftGate {
  double health_low = 0.2;       ///< Health mapped to gate 0
  double health_high = 0.6;      ///< Health mapped to gate 1
  double smoothing_alpha = 0.2;  ///< EMA weight of the newest value (~5 frames)
  double disabled_leak = 0.1;    ///< Gate ceiling while Disabled
  Hysteresis hysteresis;
  HardDisable hard_disable;
};

}  // namespace depthfuse::config

#endif  // DEPTHFUSE_CONFIG_SOFT_GATE_HPP
