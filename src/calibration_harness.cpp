// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * calibration_harness.cpp
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include "depthfuse/calibration/calibration_harness.hpp"

#include <spdlog/spdlog.h>

#include <Eigen/Core>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

#include "depthfuse/errors.hpp"
#include "depthfuse/numerics/deterministic_math.hpp"
#include "depthfuse/numerics/robust_stats.hpp"
#include "depthfuse/types.hpp"

namespace depthfuse {

namespace {

struct Sample {
  double depth;
  double confidence;
  double error;  // |depth − truth|
};

NoiseModelParameters toParameters(const Eigen::Vector3d& theta,
                                  double sigma_floor) {
  NoiseModelParameters p;
  p.sigma_base = theta(0);
  p.alpha = theta(1);
  p.beta = theta(2);
  p.sigma_floor = sigma_floor;
  return p;
}

}  // namespace

CalibrationHarness::CalibrationHarness(NoiseModel::Ptr model,
                                       const config::Calibration& cfg,
                                       CalibrationStore::Ptr store)
    : model_(std::move(model)), cfg_(cfg), store_(std::move(store)) {
  if (!model_) {
    throw std::invalid_argument("[Calibration] NoiseModel must not be null");
  }
}

NoiseModelParameters CalibrationHarness::clampParameters(
    NoiseModelParameters p) const {
  p.sigma_base = std::clamp(p.sigma_base, cfg_.sigma_base_range.min,
                            cfg_.sigma_base_range.max);
  p.alpha = std::clamp(p.alpha, cfg_.alpha_range.min, cfg_.alpha_range.max);
  p.beta = std::clamp(p.beta, cfg_.beta_range.min, cfg_.beta_range.max);
  return p;
}

CalibrationResult CalibrationHarness::fit(
    const std::vector<double>& depths, const std::vector<double>& confidences,
    const std::vector<double>& true_depths,
    const std::string& source_id) const {
  return fit(depths, confidences, true_depths, model_->parameters(source_id),
             source_id);
}

CalibrationResult CalibrationHarness::fit(
    const std::vector<double>& depths, const std::vector<double>& confidences,
    const std::vector<double>& true_depths, const NoiseModelParameters& initial,
    const std::string& source_id) const {
  if (depths.size() != confidences.size() ||
      depths.size() != true_depths.size()) {
    throw std::invalid_argument(
        "[Calibration] depths, confidences and true_depths differ in length");
  }

  std::vector<Sample> samples;
  samples.reserve(depths.size());
  for (std::size_t i = 0; i < depths.size(); ++i) {
    if (!std::isfinite(depths[i]) || !std::isfinite(true_depths[i]) ||
        !isValidConfidence(confidences[i]) || !std::isfinite(confidences[i])) {
      continue;
    }
    samples.push_back(
        {depths[i], confidences[i], std::abs(depths[i] - true_depths[i])});
  }
  if (samples.size() < cfg_.min_samples) {
    throw InsufficientCalibrationData(source_id, samples.size(),
                                      cfg_.min_samples);
  }

  const auto& nm = model_->config();
  const double floor = initial.sigma_floor;
  const NoiseModelParameters start = clampParameters(initial);
  Eigen::Vector3d theta(start.sigma_base, start.alpha, start.beta);
  const Eigen::Vector3d lo(cfg_.sigma_base_range.min, cfg_.alpha_range.min,
                           cfg_.beta_range.min);
  const Eigen::Vector3d hi(cfg_.sigma_base_range.max, cfg_.alpha_range.max,
                           cfg_.beta_range.max);

  CalibrationResult result;
  result.sample_count = samples.size();

  // IRLS with Huber weights
  for (int iter = 0; iter < cfg_.max_iterations; ++iter) {
    const auto params = toParameters(theta, floor);
    Eigen::Vector3d gradient = Eigen::Vector3d::Zero();
    double weight_sum = 0.0;

    for (const auto& s : samples) {
      const double d = std::max(s.depth, nm.min_depth);
      const double c_eff = model_->effectiveConfidence(s.confidence);
      const double depth_factor =
          det::pow(d / nm.reference_depth, params.alpha);
      const double conf_factor = 1.0 - params.beta * c_eff;
      const double pred = params.sigma_base * depth_factor * conf_factor;

      const double r = s.error - pred;
      const double abs_r = std::abs(r);
      const double w =
          abs_r <= cfg_.huber_delta ? 1.0 : cfg_.huber_delta / abs_r;

      // ∂σ/∂(sigma_base, alpha, beta)
      const Eigen::Vector3d J(depth_factor * conf_factor,
                              pred * det::log(d / nm.reference_depth),
                              -params.sigma_base * depth_factor * c_eff);
      gradient += (w * r) * J;
      weight_sum += w;
    }

    const Eigen::Vector3d step = cfg_.learning_rate * gradient / weight_sum;
    const Eigen::Vector3d next = (theta + step).cwiseMax(lo).cwiseMin(hi);
    const double delta = (next - theta).cwiseAbs().maxCoeff();
    theta = next;
    result.iterations = iter + 1;
    if (delta < cfg_.convergence_threshold) {
      result.converged = true;
      break;
    }
  }

  const auto fitted = toParameters(theta, floor);
  std::vector<double> residuals;
  residuals.reserve(samples.size());
  for (const auto& s : samples) {
    residuals.push_back(s.error -
                        model_->rawSigma(s.depth, s.confidence, fitted));
  }

  const double med = stats::median(residuals);
  const double mad = stats::medianAbsoluteDeviation(residuals);
  const double limit = cfg_.outlier_mad_multiplier * mad;
  std::size_t outliers = 0;
  for (double r : residuals) {
    if (std::abs(r - med) > limit) ++outliers;
  }

  result.sigma_base = theta(0);
  result.alpha = theta(1);
  result.beta = theta(2);
  result.residual_mad = mad;
  result.outlier_count = outliers;
  result.outlier_rate =
      static_cast<double>(outliers) / static_cast<double>(samples.size());
  result.fit_quality_score = 1.0 - std::min(2.0 * result.outlier_rate, 1.0);
  result.is_valid = result.outlier_rate < cfg_.max_outlier_rate;

  spdlog::debug(
      "[Calibration] '{}': sigma_base={:.5f} alpha={:.3f} beta={:.3f} "
      "outliers={}/{} iterations={}{}",
      source_id, result.sigma_base, result.alpha, result.beta, outliers,
      samples.size(), result.iterations,
      result.converged ? "" : " (not converged)");
  return result;
}

bool CalibrationHarness::calibrate(const std::string& source_id,
                                   const std::vector<double>& depths,
                                   const std::vector<double>& confidences,
                                   const std::vector<double>& true_depths) {
  CalibrationResult result;
  try {
    result = fit(depths, confidences, true_depths, source_id);
  } catch (const InsufficientCalibrationData& e) {
    spdlog::warn("{}; keeping prior parameters", e.what());
    return false;
  }

  if (!result.is_valid) {
    spdlog::warn(
        "[Calibration] '{}' rejected: outlier rate {:.1f}% >= {:.1f}%; "
        "keeping prior parameters",
        source_id, 100.0 * result.outlier_rate,
        100.0 * cfg_.max_outlier_rate);
    return false;
  }

  auto params = model_->parameters(source_id);
  params.sigma_base = result.sigma_base;
  params.alpha = result.alpha;
  params.beta = result.beta;
  model_->replaceParameters(source_id, params);

  if (store_ && !store_->replace(source_id, {result.sigma_base, result.alpha,
                                             result.beta})) {
    spdlog::error("[Calibration] '{}' applied but could not be persisted",
                  source_id);
  }

  spdlog::info(
      "[Calibration] '{}' updated: sigma_base={:.5f} alpha={:.3f} "
      "beta={:.3f} (quality {:.2f})",
      source_id, params.sigma_base, params.alpha, params.beta,
      result.fit_quality_score);
  return true;
}

std::future<bool> CalibrationHarness::calibrateAsync(
    std::string source_id, std::vector<double> depths,
    std::vector<double> confidences, std::vector<double> true_depths) {
  // The task owns a copy of the harness; model and store are shared.
  return std::async(std::launch::async,
                    [harness = *this, id = std::move(source_id),
                     d = std::move(depths), c = std::move(confidences),
                     t = std::move(true_depths)]() mutable {
                      return harness.calibrate(id, d, c, t);
                    });
}

}  // namespace depthfuse
