// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * numerics.hpp
 *
 * Fixed-point quantization and determinism field classification.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef DEPTHFUSE_CONFIG_NUMERICS_HPP
#define DEPTHFUSE_CONFIG_NUMERICS_HPP

#include <set>
#include <string>

namespace depthfuse {

/// Fixed-point rounding implementation.
enum class QuantizerBackend {
  Arithmetic,  ///< Scale and std::nearbyint (round half to even)
  Integer      ///< IEEE-754 bit decomposition, integer rounding
};

namespace config {

/// Q(range bits).(fractional_bits) fixed point, stored in int64.
struct Quantization {
  int fractional_bits = 16;  ///< Scale = 2^fractional_bits
  double range = 32768.0;    ///< Representable magnitude [-range, range)
  QuantizerBackend backend = QuantizerBackend::Arithmetic;
};

/**
 * @brief Closed classification of every emitted field.
 *
 * keys: fields that must be bit-identical across platforms.
 * ignored_keys: fields allowed to vary (timing, identifiers).
 * The two sets must be disjoint.
 */
struct Determinism {
  std::set<std::string> keys = {
      "noise_sigma", "effective_mean", "weight",      "logit",
      "gate",        "final_quality",  "uncertainty", "uncertainty_penalty"};
  std::set<std::string> ignored_keys = {"latency", "timestamp", "device_id",
                                        "source_id", "diagnostic_sampling"};
};

}  // namespace config
}  // namespace depthfuse

#endif  // DEPTHFUSE_CONFIG_NUMERICS_HPP
