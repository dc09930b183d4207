// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * quantizer.cpp
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include "depthfuse/numerics/quantizer.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <cstring>

namespace depthfuse {

Quantizer::Quantizer(const config::Quantization& cfg)
    : fractional_bits_(cfg.fractional_bits),
      scale_(std::ldexp(1.0, cfg.fractional_bits)),
      step_(std::ldexp(1.0, -cfg.fractional_bits)) {
  const auto span = static_cast<std::int64_t>(cfg.range * scale_);
  raw_min_ = -span;
  raw_max_ = span - 1;
  min_value_ = static_cast<double>(raw_min_) / scale_;
  max_value_ = static_cast<double>(raw_max_) / scale_;
}

std::int64_t Quantizer::quantize(double value, std::string_view field) const {
  if (!std::isfinite(value)) {
    spdlog::warn("[Quantizer] Non-finite value ({}) for '{}', using 0", value,
                 field);
    return 0;
  }
  if (value == 0.0) return 0;  // -0.0 and +0.0 share one encoding

  if (value > max_value_) {
    spdlog::warn("[Quantizer] Overflow for '{}': {} clamped to {}", field,
                 value, max_value_);
    return raw_max_;
  }
  if (value < min_value_) {
    spdlog::warn("[Quantizer] Overflow for '{}': {} clamped to {}", field,
                 value, min_value_);
    return raw_min_;
  }
  return std::clamp(roundScaled(value), raw_min_, raw_max_);
}

double Quantizer::dequantize(std::int64_t raw) const {
  return static_cast<double>(raw) / scale_;
}

bool Quantizer::overflows(double value) const {
  return std::isfinite(value) && (value > max_value_ || value < min_value_);
}

std::int64_t ArithmeticQuantizer::roundScaled(double value) const {
  return static_cast<std::int64_t>(std::nearbyint(value * scale_));
}

std::int64_t IntegerQuantizer::roundScaled(double value) const {
  std::uint64_t bits = 0;
  std::memcpy(&bits, &value, sizeof(bits));

  const bool negative = (bits >> 63) != 0;
  const int biased_exp = static_cast<int>((bits >> 52) & 0x7FF);
  std::uint64_t mantissa = bits & ((std::uint64_t{1} << 52) - 1);

  int exp = biased_exp;
  if (biased_exp == 0) {
    exp = 1;  // subnormal
  } else {
    mantissa |= std::uint64_t{1} << 52;
  }

  // |value| × 2^F = mantissa × 2^shift
  const int shift = exp - 1075 + fractional_bits_;

  std::uint64_t magnitude = 0;
  if (shift >= 0) {
    magnitude = mantissa << shift;
  } else {
    const int n = -shift;
    if (n >= 54) return 0;  // below half a step
    const std::uint64_t q = mantissa >> n;
    const std::uint64_t rem = mantissa & ((std::uint64_t{1} << n) - 1);
    const std::uint64_t half = std::uint64_t{1} << (n - 1);
    magnitude = q;
    if (rem > half || (rem == half && (q & 1))) ++magnitude;
  }

  const auto result = static_cast<std::int64_t>(magnitude);
  return negative ? -result : result;
}

std::unique_ptr<Quantizer> createQuantizer(const config::Quantization& cfg) {
  switch (cfg.backend) {
    case QuantizerBackend::Integer:
      return std::make_unique<IntegerQuantizer>(cfg);
    case QuantizerBackend::Arithmetic:
      return std::make_unique<ArithmeticQuantizer>(cfg);
    default:
      spdlog::warn("[Quantizer] Unknown backend ({}), using arithmetic",
                   static_cast<int>(cfg.backend));
      return std::make_unique<ArithmeticQuantizer>(cfg);
  }
}

}  // namespace depthfuse
