// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * config_depthfuse.cpp
 *
 * YAML configuration loading.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

#include "depthfuse/config/depthfuse.hpp"

namespace depthfuse {
namespace detail {

template <typename T>
void load(const YAML::Node& node, const std::string& key, T& value) {
  if (node[key]) {
    value = node[key].as<T>();
  }
}

void loadRange(const YAML::Node& node, const std::string& key,
               config::Range& range) {
  if (auto r = node[key]) {
    if (!r.IsSequence() || r.size() != 2) {
      throw std::invalid_argument("calibration." + key +
                                  " must be a [min, max] pair");
    }
    range.min = r[0].as<double>();
    range.max = r[1].as<double>();
  }
}

void loadParameters(const YAML::Node& node, NoiseModelParameters& params) {
  load(node, "sigma_base", params.sigma_base);
  load(node, "alpha", params.alpha);
  load(node, "beta", params.beta);
  load(node, "sigma_floor", params.sigma_floor);
}

QuantizerBackend parseBackend(const std::string& backend) {
  if (backend == "arithmetic") return QuantizerBackend::Arithmetic;
  if (backend == "integer") return QuantizerBackend::Integer;
  spdlog::warn(
      "[Config] Unknown quantization.backend '{}', defaulting to arithmetic",
      backend);
  return QuantizerBackend::Arithmetic;
}

Config parse(const YAML::Node& root) {
  Config cfg;

  // Soft gate (health mapping, hysteresis, hard disable)
  if (auto n = root["soft_gate"]) {
    auto& g = cfg.soft_gate;
    load(n, "health_low", g.health_low);
    load(n, "health_high", g.health_high);
    load(n, "smoothing_alpha", g.smoothing_alpha);
    load(n, "disabled_leak", g.disabled_leak);
  }
  if (auto n = root["hysteresis"]) {
    auto& h = cfg.soft_gate.hysteresis;
    load(n, "enter_threshold", h.enter_threshold);
    load(n, "exit_threshold", h.exit_threshold);
    load(n, "confirm_frames", h.confirm_frames);
  }
  if (auto n = root["hard_disable"]) {
    auto& h = cfg.soft_gate.hard_disable;
    load(n, "threshold", h.threshold);
    load(n, "confirm_frames", h.confirm_frames);
  }

  // Noise model
  if (auto n = root["noise_model"]) {
    auto& m = cfg.noise_model;
    load(n, "conf_floor", m.conf_floor);
    load(n, "reference_depth", m.reference_depth);
    load(n, "min_depth", m.min_depth);
    if (auto d = n["default"]) loadParameters(d, m.defaults);
    if (auto s = n["sources"]) {
      for (const auto& entry : s) {
        const auto id = entry.first.as<std::string>();
        NoiseModelParameters params = m.defaults;
        loadParameters(entry.second, params);
        m.sources[id] = params;
      }
    }
  }

  // Calibration
  if (auto n = root["calibration"]) {
    auto& c = cfg.calibration;
    load(n, "min_samples", c.min_samples);
    load(n, "huber_delta", c.huber_delta);
    load(n, "learning_rate", c.learning_rate);
    load(n, "max_iterations", c.max_iterations);
    load(n, "convergence_threshold", c.convergence_threshold);
    load(n, "outlier_mad_multiplier", c.outlier_mad_multiplier);
    load(n, "max_outlier_rate", c.max_outlier_rate);
    loadRange(n, "sigma_base_range", c.sigma_base_range);
    loadRange(n, "alpha_range", c.alpha_range);
    loadRange(n, "beta_range", c.beta_range);
  }

  // Uncertainty propagation
  if (auto n = root["uncertainty"]) {
    auto& u = cfg.uncertainty;
    load(n, "rho_max", u.rho_max);
    load(n, "penalty_k", u.penalty_k);
    load(n, "penalty_min", u.penalty_min);
    if (auto pairs = n["correlated_pairs"]) {
      u.correlated_pairs.clear();
      for (const auto& p : pairs) {
        if (!p.IsSequence() || p.size() != 2) {
          throw std::invalid_argument(
              "uncertainty.correlated_pairs entries must be [name, name]");
        }
        u.correlated_pairs.emplace_back(p[0].as<std::string>(),
                                        p[1].as<std::string>());
      }
    }
  }

  // Quantization
  if (auto n = root["quantization"]) {
    auto& q = cfg.quantization;
    load(n, "fractional_bits", q.fractional_bits);
    load(n, "range", q.range);
    std::string backend_str;
    load(n, "backend", backend_str);
    if (!backend_str.empty()) q.backend = parseBackend(backend_str);
  }

  // Determinism field classification (replaces the defaults when given)
  if (auto n = root["determinism"]) {
    if (auto k = n["keys"]) {
      cfg.determinism.keys.clear();
      for (const auto& key : k) {
        cfg.determinism.keys.insert(key.as<std::string>());
      }
    }
    if (auto k = n["ignored_keys"]) {
      cfg.determinism.ignored_keys.clear();
      for (const auto& key : k) {
        cfg.determinism.ignored_keys.insert(key.as<std::string>());
      }
    }
  }

  // Frame synchronizer
  if (auto n = root["synchronizer"]) {
    auto& s = cfg.synchronizer;
    load(n, "sources", s.sources);
    load(n, "sync_tolerance", s.sync_tolerance);
    load(n, "buffer_size", s.buffer_size);
  }

  if (auto n = root["logging"]) {
    load(n, "level", cfg.logging.level);
  }

  return cfg;
}

}  // namespace detail

namespace {

// NaN fails every ordered comparison, so the range checks below cannot see it.
void requireFinite(const Config& cfg) {
  auto check = [](const std::string& name, double val) {
    if (!std::isfinite(val)) {
      throw std::invalid_argument(name + " must be finite, got " +
                                  std::to_string(val));
    }
  };
  auto check_params = [&](const std::string& prefix,
                          const NoiseModelParameters& p) {
    check(prefix + ".sigma_base", p.sigma_base);
    check(prefix + ".alpha", p.alpha);
    check(prefix + ".beta", p.beta);
    check(prefix + ".sigma_floor", p.sigma_floor);
  };

  const auto& g = cfg.soft_gate;
  check("soft_gate.health_low", g.health_low);
  check("soft_gate.health_high", g.health_high);
  check("soft_gate.smoothing_alpha", g.smoothing_alpha);
  check("soft_gate.disabled_leak", g.disabled_leak);
  check("hysteresis.enter_threshold", g.hysteresis.enter_threshold);
  check("hysteresis.exit_threshold", g.hysteresis.exit_threshold);
  check("hard_disable.threshold", g.hard_disable.threshold);

  const auto& m = cfg.noise_model;
  check("noise_model.conf_floor", m.conf_floor);
  check("noise_model.reference_depth", m.reference_depth);
  check("noise_model.min_depth", m.min_depth);
  check_params("noise_model.default", m.defaults);
  for (const auto& [id, params] : m.sources) {
    check_params("noise_model.sources." + id, params);
  }

  const auto& c = cfg.calibration;
  check("calibration.huber_delta", c.huber_delta);
  check("calibration.learning_rate", c.learning_rate);
  check("calibration.convergence_threshold", c.convergence_threshold);
  check("calibration.outlier_mad_multiplier", c.outlier_mad_multiplier);
  check("calibration.max_outlier_rate", c.max_outlier_rate);
  for (const auto& [name, r] :
       {std::pair{"sigma_base_range", c.sigma_base_range},
        std::pair{"alpha_range", c.alpha_range},
        std::pair{"beta_range", c.beta_range}}) {
    check(std::string("calibration.") + name + ".min", r.min);
    check(std::string("calibration.") + name + ".max", r.max);
  }

  const auto& u = cfg.uncertainty;
  check("uncertainty.rho_max", u.rho_max);
  check("uncertainty.penalty_k", u.penalty_k);
  check("uncertainty.penalty_min", u.penalty_min);

  check("quantization.range", cfg.quantization.range);
  check("synchronizer.sync_tolerance", cfg.synchronizer.sync_tolerance);
}

}  // namespace

void validateConfig(Config& cfg) {
  requireFinite(cfg);
  auto& g = cfg.soft_gate;

  // --- Fatal: invalid ranges that break the state machine ---
  if (g.hysteresis.enter_threshold <= g.hysteresis.exit_threshold) {
    throw std::invalid_argument(
        "hysteresis: enter_threshold (" +
        std::to_string(g.hysteresis.enter_threshold) +
        ") must be > exit_threshold (" +
        std::to_string(g.hysteresis.exit_threshold) + ")");
  }
  if (g.health_low >= g.health_high) {
    throw std::invalid_argument(
        "soft_gate: health_low (" + std::to_string(g.health_low) +
        ") must be < health_high (" + std::to_string(g.health_high) + ")");
  }
  auto require_range = [](const std::string& name, const config::Range& r) {
    if (r.min > r.max) {
      throw std::invalid_argument("calibration." + name + ": min (" +
                                  std::to_string(r.min) + ") > max (" +
                                  std::to_string(r.max) + ")");
    }
  };
  require_range("sigma_base_range", cfg.calibration.sigma_base_range);
  require_range("alpha_range", cfg.calibration.alpha_range);
  require_range("beta_range", cfg.calibration.beta_range);

  for (const auto& key : cfg.determinism.keys) {
    if (cfg.determinism.ignored_keys.count(key)) {
      throw std::invalid_argument("determinism: field '" + key +
                                  "' is listed in both keys and ignored_keys");
    }
  }

  // --- Non-fatal: warn and clamp ---
  auto warn_clamp = [](const std::string& name, auto& val, auto lo, auto hi) {
    if (!(val >= lo && val <= hi)) {
      spdlog::warn("[Config] {} ({}) out of range [{}, {}], clamping", name, val,
                   lo, hi);
      val = std::clamp(val, static_cast<std::decay_t<decltype(val)>>(lo),
                       static_cast<std::decay_t<decltype(val)>>(hi));
    }
  };
  auto warn_min = [](const std::string& name, auto& val, auto lo) {
    if (val < lo) {
      spdlog::warn("[Config] {} ({}) must be >= {}, clamping", name, val, lo);
      val = lo;
    }
  };

  warn_clamp("soft_gate.smoothing_alpha", g.smoothing_alpha, 0.01, 1.0);
  warn_clamp("soft_gate.disabled_leak", g.disabled_leak, 0.0, 1.0);
  warn_min("hysteresis.confirm_frames", g.hysteresis.confirm_frames, 1);
  warn_min("hard_disable.confirm_frames", g.hard_disable.confirm_frames, 1);
  warn_clamp("hard_disable.threshold", g.hard_disable.threshold, 0.0, 1.0);
  if (g.hard_disable.threshold >= g.hysteresis.enter_threshold) {
    spdlog::warn(
        "[Config] hard_disable.threshold ({}) >= hysteresis.enter_threshold "
        "({}); a recovered source would be disabled again immediately",
        g.hard_disable.threshold, g.hysteresis.enter_threshold);
  }

  // Noise model: alpha >= 0 and beta < 1 keep σ monotone and positive
  auto& m = cfg.noise_model;
  warn_clamp("noise_model.conf_floor", m.conf_floor, 1e-6, 1.0);
  if (m.reference_depth <= 0.0) {
    spdlog::warn(
        "[Config] noise_model.reference_depth ({}) must be > 0, clamping to 2.0",
        m.reference_depth);
    m.reference_depth = 2.0;
  }
  if (m.min_depth <= 0.0) {
    spdlog::warn(
        "[Config] noise_model.min_depth ({}) must be > 0, clamping to 0.001",
        m.min_depth);
    m.min_depth = 1e-3;
  }
  auto validate_params = [&](const std::string& prefix,
                             NoiseModelParameters& p) {
    if (p.sigma_base <= 0.0) {
      spdlog::warn("[Config] {}.sigma_base ({}) must be > 0, clamping to 0.02",
                   prefix, p.sigma_base);
      p.sigma_base = 0.02;
    }
    warn_min(prefix + ".alpha", p.alpha, 0.0);
    warn_clamp(prefix + ".beta", p.beta, 0.0, 0.99);
    warn_min(prefix + ".sigma_floor", p.sigma_floor, 0.0);
  };
  validate_params("noise_model.default", m.defaults);
  for (auto& [id, params] : m.sources) {
    validate_params("noise_model.sources." + id, params);
  }

  // Calibration
  auto& c = cfg.calibration;
  warn_min("calibration.min_samples", c.min_samples, std::size_t{1});
  if (c.huber_delta <= 0.0) {
    spdlog::warn(
        "[Config] calibration.huber_delta ({}) must be > 0, clamping to 0.05",
        c.huber_delta);
    c.huber_delta = 0.05;
  }
  if (c.learning_rate <= 0.0) {
    spdlog::warn(
        "[Config] calibration.learning_rate ({}) must be > 0, clamping to 0.01",
        c.learning_rate);
    c.learning_rate = 0.01;
  }
  warn_min("calibration.max_iterations", c.max_iterations, 1);
  warn_min("calibration.convergence_threshold", c.convergence_threshold, 0.0);
  warn_min("calibration.outlier_mad_multiplier", c.outlier_mad_multiplier,
           0.0);
  warn_clamp("calibration.max_outlier_rate", c.max_outlier_rate, 0.0, 1.0);

  // Uncertainty
  auto& u = cfg.uncertainty;
  warn_clamp("uncertainty.rho_max", u.rho_max, 0.0, 1.0);
  warn_min("uncertainty.penalty_k", u.penalty_k, 0.0);
  warn_clamp("uncertainty.penalty_min", u.penalty_min, 0.0, 1.0);

  // Quantization: scaled range must stay exact in a double and fit int64
  auto& q = cfg.quantization;
  warn_clamp("quantization.fractional_bits", q.fractional_bits, 1, 30);
  if (!(q.range > 0.0) || q.range > 1048576.0) {
    spdlog::warn(
        "[Config] quantization.range ({}) out of (0, 1048576], clamping to "
        "32768",
        q.range);
    q.range = 32768.0;
  }

  auto& s = cfg.synchronizer;
  warn_min("synchronizer.sync_tolerance", s.sync_tolerance, 0.0);
  warn_min("synchronizer.buffer_size", s.buffer_size, std::size_t{1});

  static const char* kLevels[] = {"trace", "debug", "info",    "warn",
                                  "error", "critical", "off"};
  if (std::find(std::begin(kLevels), std::end(kLevels), cfg.logging.level) ==
      std::end(kLevels)) {
    spdlog::warn("[Config] Unknown logging.level '{}', defaulting to info",
                 cfg.logging.level);
    cfg.logging.level = "info";
  }
}

Config parseConfig(const YAML::Node& root) {
  auto cfg = detail::parse(root);
  validateConfig(cfg);
  return cfg;
}

Config loadConfig(const std::string& path) {
  try {
    return parseConfig(YAML::LoadFile(path));
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to load config: " + path + " - " +
                             e.what());
  }
}

void applyLogging(const config::Logging& cfg) {
  spdlog::set_level(spdlog::level::from_str(cfg.level));
}

}  // namespace depthfuse
