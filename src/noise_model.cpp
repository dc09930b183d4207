// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * noise_model.cpp
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include "depthfuse/noise/noise_model.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <mutex>
#include <utility>

#include "depthfuse/calibration/calibration_store.hpp"
#include "depthfuse/numerics/deterministic_math.hpp"
#include "depthfuse/types.hpp"

namespace depthfuse {

NoiseModel::NoiseModel(const config::NoiseModel& cfg)
    : cfg_(cfg), table_(std::make_shared<const ParameterTable>(cfg.sources)) {}

double NoiseModel::effectiveConfidence(double confidence) const {
  return std::clamp(confidence, cfg_.conf_floor, 1.0);
}

double NoiseModel::rawSigma(double depth, double confidence,
                            const NoiseModelParameters& params) const {
  const double d = std::max(depth, cfg_.min_depth);
  const double depth_factor = det::pow(d / cfg_.reference_depth, params.alpha);
  const double conf_factor =
      1.0 - params.beta * effectiveConfidence(confidence);
  return params.sigma_base * depth_factor * conf_factor;
}

std::optional<double> NoiseModel::sigma(
    double depth, double confidence, const NoiseModelParameters& params) const {
  if (!isValidConfidence(confidence) || !std::isfinite(depth)) {
    return std::nullopt;
  }
  return std::max(params.sigma_floor, rawSigma(depth, confidence, params));
}

std::optional<double> NoiseModel::sigma(double depth, double confidence,
                                        const std::string& source_id) const {
  return sigma(depth, confidence, parameters(source_id));
}

NoiseModelParameters NoiseModel::parametersIn(
    const ParameterTable& table, const std::string& source_id) const {
  auto it = table.find(source_id);
  return it == table.end() ? cfg_.defaults : it->second;
}

NoiseModelParameters NoiseModel::parameters(
    const std::string& source_id) const {
  return parametersIn(*snapshot(), source_id);
}

std::shared_ptr<const NoiseModel::ParameterTable> NoiseModel::snapshot()
    const {
  std::shared_lock lock(mutex_);
  return table_;
}

void NoiseModel::replaceParameters(const std::string& source_id,
                                   const NoiseModelParameters& params) {
  std::unique_lock lock(mutex_);
  auto next = std::make_shared<ParameterTable>(*table_);
  (*next)[source_id] = params;
  table_ = std::move(next);
}

void NoiseModel::replaceAll(ParameterTable table) {
  auto next = std::make_shared<const ParameterTable>(std::move(table));
  std::unique_lock lock(mutex_);
  table_ = std::move(next);
}

std::size_t NoiseModel::loadFrom(const CalibrationStore& store) {
  const auto stored = store.loadAll();
  if (stored.empty()) return 0;

  std::unique_lock lock(mutex_);
  auto next = std::make_shared<ParameterTable>(*table_);
  for (const auto& [id, calibration] : stored) {
    NoiseModelParameters params = parametersIn(*next, id);
    params.sigma_base = calibration.sigma_base;
    params.alpha = calibration.alpha;
    params.beta = calibration.beta;
    (*next)[id] = params;
  }
  table_ = std::move(next);
  spdlog::info("[NoiseModel] Loaded calibration for {} source(s)",
               stored.size());
  return stored.size();
}

}  // namespace depthfuse
