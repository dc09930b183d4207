// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * fusion_arbitrator.hpp
 *
 * Per-frame arbitration of multiple depth sources into one quality-scored
 * depth estimate.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef DEPTHFUSE_FUSION_FUSION_ARBITRATOR_HPP
#define DEPTHFUSE_FUSION_FUSION_ARBITRATOR_HPP

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Configs
#include "depthfuse/config/depthfuse.hpp"

// Data types
#include "depthfuse/fusion/fusion_result.hpp"
#include "depthfuse/types.hpp"

// Core objects
#include "depthfuse/health/source_health_tracker.hpp"
#include "depthfuse/noise/noise_model.hpp"
#include "depthfuse/numerics/field_registry.hpp"
#include "depthfuse/numerics/quantizer.hpp"
#include "depthfuse/uncertainty/uncertainty_propagator.hpp"

namespace depthfuse {

/**
 * @brief Fuses one FrameInput into one FusionResult.
 *
 * Per frame, in sorted source-id order:
 *   1. update every source's gate from its health (missing health → 0)
 *   2. σ per valid sample from one NoiseModel snapshot; weight = gate / σ²
 *   3. weighted depth, quality and aggregate gate
 *   4. depth, disagreement and temporal variances → UncertaintyPropagator
 *   5. final_quality = gate × mean quality × uncertainty penalty
 *   6. determinism-key fields quantized to fixed point; the weight/<id>
 *      fields sum to exactly 1.0, the rounding residue going to the
 *      largest weight (lowest id on ties)
 *
 * Values outside the fixed-point range are clamped and reported in
 * FusionResult::overflows and Statistics::quantization_overflows.
 *
 * A frame with no positively weighted source yields std::nullopt.
 *
 * ## Thread safety
 *
 * process() and reset() serialise on an internal mutex. The NoiseModel may
 * be shared with a CalibrationHarness running on another thread.
 * tracker() and the other accessors are not synchronised with process().
 */
class FusionArbitrator {
 public:
  struct Statistics {
    std::uint64_t frames_processed = 0;
    std::uint64_t frames_emitted = 0;
    std::uint64_t frames_without_source = 0;
    std::uint64_t quantization_overflows = 0;
  };

  /// @throws UnknownDeterminismField if an emitted field is unclassified
  explicit FusionArbitrator(const Config& cfg);

  /// Share a NoiseModel (e.g. with a CalibrationHarness).
  FusionArbitrator(const Config& cfg, NoiseModel::Ptr noise_model);

  // Non-copyable
  FusionArbitrator(const FusionArbitrator&) = delete;
  FusionArbitrator& operator=(const FusionArbitrator&) = delete;

  std::optional<FusionResult> process(const FrameInput& frame);

  const SourceHealthTracker& tracker() const { return tracker_; }
  const NoiseModel& noiseModel() const { return *noise_model_; }
  NoiseModel::Ptr sharedNoiseModel() const { return noise_model_; }
  const UncertaintyPropagator& propagator() const { return propagator_; }
  const Quantizer& quantizer() const { return *quantizer_; }
  const FieldRegistry& fields() const { return registry_; }
  const Config& config() const { return cfg_; }

  Statistics statistics() const;

  /// Forget all per-source state, temporal history and statistics.
  void reset();

  /// Base names of every field process() emits.
  static std::vector<std::string> emittedFields();

 private:
  /// Normalized weights in fixed point, corrected to sum to exactly 1.0.
  std::vector<std::int64_t> quantizeWeights(
      const std::vector<SourceContribution>& contributions) const;

  Config cfg_;
  FieldRegistry registry_;
  std::unique_ptr<Quantizer> quantizer_;
  NoiseModel::Ptr noise_model_;
  SourceHealthTracker tracker_;
  UncertaintyPropagator propagator_;

  std::optional<double> previous_mean_;
  Statistics stats_;
  mutable std::mutex mutex_;
};

}  // namespace depthfuse

#endif  // DEPTHFUSE_FUSION_FUSION_ARBITRATOR_HPP
