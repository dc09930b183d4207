// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * types.hpp
 *
 * Per-frame input types shared by the fusion components.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef DEPTHFUSE_TYPES_HPP
#define DEPTHFUSE_TYPES_HPP

#include <limits>
#include <map>
#include <string>
#include <vector>

namespace depthfuse {

/// Confidence sentinel for a sample the producer could not score.
inline constexpr double kInvalidConfidence =
    std::numeric_limits<double>::quiet_NaN();

/// A sample is usable only with a strictly positive confidence (NaN fails).
inline bool isValidConfidence(double confidence) noexcept {
  return confidence > 0.0;
}

/**
 * @brief One depth estimate from one sensing source.
 *
 * Produced externally every frame and consumed once.
 */
struct SourceSample {
  std::string source_id;
  double depth = 0.0;       ///< [m]
  double confidence = 0.0;  ///< [0, 1], or kInvalidConfidence
  double timestamp = 0.0;   ///< [s]
};

/**
 * @brief Complete, consistent snapshot of all sources for one frame.
 *
 * health: externally supplied reliability per source, 0 (broken) .. 1.
 * extra_variances: additional named variance contributions (e.g.
 * "anomaly_variance") merged with the arbitrator's own.
 */
struct FrameInput {
  double timestamp = 0.0;
  std::vector<SourceSample> samples;
  std::map<std::string, double> health;
  std::map<std::string, double> extra_variances;
};

}  // namespace depthfuse

#endif  // DEPTHFUSE_TYPES_HPP
