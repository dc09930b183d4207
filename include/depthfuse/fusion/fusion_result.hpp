// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef DEPTHFUSE_FUSION_FUSION_RESULT_HPP
#define DEPTHFUSE_FUSION_FUSION_RESULT_HPP

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "depthfuse/numerics/quantizer.hpp"

namespace depthfuse {

/// One source's share of a fused frame.
struct SourceContribution {
  std::string source_id;
  double depth = 0.0;
  double confidence = 0.0;
  double sigma = 0.0;
  double gate = 0.0;
  double weight = 0.0;             ///< gate / σ²
  double normalized_weight = 0.0;  ///< weight / Σ weight
};

/// A determinism field whose value fell outside the fixed-point range.
struct QuantizationOverflow {
  std::uint64_t frame_index = 0;
  std::string field;
  double value = 0.0;        ///< Unclamped input
  std::int64_t clamped = 0;  ///< Raw value actually emitted
};

/**
 * @brief Fused output for one frame. Immutable once returned.
 *
 * determinism_fields holds every determinism-key field in fixed point;
 * these are the values compared across platforms. diagnostic_fields holds
 * ignored fields (timestamp, latency) as plain doubles.
 */
struct FusionResult {
  std::uint64_t frame_index = 0;
  double timestamp = 0.0;
  double final_depth = 0.0;
  double final_quality = 0.0;
  double gate = 0.0;  ///< Aggregate gate of the contributing sources
  double uncertainty_penalty = 1.0;
  double total_uncertainty = 0.0;
  double quality_logit = 0.0;
  std::vector<SourceContribution> contributions;  ///< Sorted by source id
  std::map<std::string, double> variances;        ///< Inputs to propagation
  std::map<std::string, QuantizedValue> determinism_fields;
  std::map<std::string, double> diagnostic_fields;
  std::vector<QuantizationOverflow> overflows;
};

}  // namespace depthfuse

#endif  // DEPTHFUSE_FUSION_FUSION_RESULT_HPP
