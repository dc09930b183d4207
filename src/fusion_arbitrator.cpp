// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * fusion_arbitrator.cpp
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include "depthfuse/fusion/fusion_arbitrator.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <map>
#include <set>
#include <stdexcept>
#include <utility>

#include "depthfuse/numerics/deterministic_math.hpp"

namespace depthfuse {

namespace {

constexpr double kQualityEpsilon = 1e-6;

}  // namespace

FusionArbitrator::FusionArbitrator(const Config& cfg)
    : FusionArbitrator(cfg, std::make_shared<NoiseModel>(cfg.noise_model)) {}

FusionArbitrator::FusionArbitrator(const Config& cfg,
                                   NoiseModel::Ptr noise_model)
    : cfg_(cfg),
      registry_(cfg.determinism),
      quantizer_(createQuantizer(cfg.quantization)),
      noise_model_(std::move(noise_model)),
      tracker_(cfg.soft_gate),
      propagator_(cfg.uncertainty) {
  if (!noise_model_) {
    throw std::invalid_argument(
        "[FusionArbitrator] NoiseModel must not be null");
  }
  registry_.require(emittedFields());
}

std::vector<std::string> FusionArbitrator::emittedFields() {
  return {"noise_sigma", "weight", "gate",
          "effective_mean", "final_quality", "uncertainty",
          "uncertainty_penalty", "logit", "timestamp", "latency"};
}

std::optional<FusionResult> FusionArbitrator::process(const FrameInput& frame) {
  std::lock_guard lock(mutex_);
  const auto start = std::chrono::steady_clock::now();
  const std::uint64_t frame_index = stats_.frames_processed++;

  // First sample per source wins
  std::map<std::string, const SourceSample*> samples;
  for (const auto& s : frame.samples) {
    if (!samples.emplace(s.source_id, &s).second) {
      spdlog::warn("[FusionArbitrator] Duplicate sample for '{}', ignoring",
                   s.source_id);
    }
  }

  // 1. Gates for every source seen this frame
  std::set<std::string> ids;
  for (const auto& [id, h] : frame.health) ids.insert(id);
  for (const auto& [id, s] : samples) ids.insert(id);

  std::map<std::string, double> gates;
  for (const auto& id : ids) {
    auto it = frame.health.find(id);
    double health = 0.0;
    if (it != frame.health.end()) {
      health = it->second;
    } else {
      spdlog::debug("[FusionArbitrator] No health for '{}', using 0", id);
    }
    gates[id] = tracker_.computeGate(id, health);
  }

  // 2. Weights from one parameter snapshot
  const auto table = noise_model_->snapshot();
  std::vector<SourceContribution> contributions;
  for (const auto& [id, s] : samples) {
    if (!std::isfinite(s->depth)) {
      spdlog::warn("[FusionArbitrator] Non-finite depth from '{}', skipping",
                   id);
      continue;
    }
    if (tracker_.isHardDisabled(id)) continue;

    const auto sigma = noise_model_->sigma(
        s->depth, s->confidence, noise_model_->parametersIn(*table, id));
    if (!sigma) continue;  // invalid confidence

    SourceContribution c;
    c.source_id = id;
    c.depth = s->depth;
    c.confidence = s->confidence;
    c.sigma = *sigma;
    c.gate = gates[id];
    c.weight = c.gate / (c.sigma * c.sigma);
    if (!(c.weight > 0.0)) continue;
    contributions.push_back(std::move(c));
  }

  // 3. No contributor
  if (contributions.empty()) {
    ++stats_.frames_without_source;
    spdlog::debug("[FusionArbitrator] Frame {}: no valid source", frame_index);
    return std::nullopt;
  }

  double sum_w = 0.0;
  double sum_wd = 0.0;
  double sum_wq = 0.0;
  double sum_inv_var = 0.0;
  for (const auto& c : contributions) {
    sum_w += c.weight;
    sum_wd += c.weight * c.depth;
    sum_wq += c.weight * std::clamp(c.confidence, 0.0, 1.0);
    sum_inv_var += 1.0 / (c.sigma * c.sigma);
  }
  const double mean = sum_wd / sum_w;
  const double mean_quality = sum_wq / sum_w;
  const double aggregate_gate = std::clamp(sum_w / sum_inv_var, 0.0, 1.0);

  // 4. Variances
  double depth_var_num = 0.0;
  double disagreement_num = 0.0;
  for (auto& c : contributions) {
    c.normalized_weight = c.weight / sum_w;
    depth_var_num += c.weight * c.weight * c.sigma * c.sigma;
    const double dev = c.depth - mean;
    disagreement_num += c.weight * dev * dev;
  }

  std::map<std::string, double> variances = frame.extra_variances;
  variances["depth_variance"] = depth_var_num / (sum_w * sum_w);
  variances["source_disagreement_variance"] = disagreement_num / sum_w;
  double temporal = 0.0;
  if (previous_mean_) {
    const double diff = mean - *previous_mean_;
    temporal = 0.5 * diff * diff;
  }
  variances["temporal_variance"] = temporal;
  previous_mean_ = mean;

  const auto estimate = propagator_.propagate(variances);

  // 5. Quality
  const double quality = aggregate_gate * mean_quality * estimate.penalty;
  const double q =
      std::clamp(quality, kQualityEpsilon, 1.0 - kQualityEpsilon);
  const double logit = det::log(q) - det::log(1.0 - q);

  FusionResult result;
  result.frame_index = frame_index;
  result.timestamp = frame.timestamp;
  result.final_depth = mean;
  result.final_quality = quality;
  result.gate = aggregate_gate;
  result.uncertainty_penalty = estimate.penalty;
  result.total_uncertainty = estimate.total_uncertainty;
  result.quality_logit = logit;

  // 6. Fixed-point determinism fields
  auto emit = [&](const std::string& field, double value) {
    const auto raw = quantizer_->quantize(value, field);
    if (quantizer_->overflows(value)) {
      result.overflows.push_back({frame_index, field, value, raw});
    }
    result.determinism_fields[field] = {raw, registry_.classify(field)};
  };
  for (const auto& c : contributions) {
    emit("noise_sigma/" + c.source_id, c.sigma);
  }
  const auto weights = quantizeWeights(contributions);
  for (std::size_t i = 0; i < contributions.size(); ++i) {
    const auto field = "weight/" + contributions[i].source_id;
    result.determinism_fields[field] = {weights[i], registry_.classify(field)};
  }
  for (const auto& [id, g] : gates) emit("gate/" + id, g);
  emit("effective_mean", mean);
  emit("gate", aggregate_gate);
  emit("final_quality", quality);
  emit("uncertainty", estimate.total_uncertainty);
  for (const auto& [name, var] : variances) emit("uncertainty/" + name, var);
  emit("uncertainty_penalty", estimate.penalty);
  emit("logit", logit);

  result.contributions = std::move(contributions);
  result.variances = std::move(variances);

  const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
      std::chrono::steady_clock::now() - start);
  result.diagnostic_fields["timestamp"] = frame.timestamp;
  result.diagnostic_fields["latency"] = static_cast<double>(elapsed.count());

  stats_.quantization_overflows += result.overflows.size();
  ++stats_.frames_emitted;
  return result;
}

std::vector<std::int64_t> FusionArbitrator::quantizeWeights(
    const std::vector<SourceContribution>& contributions) const {
  std::vector<std::int64_t> raw;
  raw.reserve(contributions.size());
  std::int64_t sum = 0;
  for (const auto& c : contributions) {
    raw.push_back(quantizer_->quantize(c.normalized_weight, "weight"));
    sum += raw.back();
  }
  if (raw.empty()) return raw;

  // Rounding residue goes to the largest weight; ties keep the lowest id.
  const std::int64_t remainder = quantizer_->quantize(1.0, "weight") - sum;
  if (remainder != 0) {
    std::size_t largest = 0;
    for (std::size_t i = 1; i < raw.size(); ++i) {
      if (raw[i] > raw[largest]) largest = i;
    }
    raw[largest] += remainder;
  }
  return raw;
}

FusionArbitrator::Statistics FusionArbitrator::statistics() const {
  std::lock_guard lock(mutex_);
  return stats_;
}

void FusionArbitrator::reset() {
  std::lock_guard lock(mutex_);
  tracker_.clear();
  previous_mean_.reset();
  stats_ = Statistics{};
}

}  // namespace depthfuse
