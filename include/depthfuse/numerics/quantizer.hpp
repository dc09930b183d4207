// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * quantizer.hpp
 *
 * Fixed-point quantization of determinism-key fields.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef DEPTHFUSE_NUMERICS_QUANTIZER_HPP
#define DEPTHFUSE_NUMERICS_QUANTIZER_HPP

#include <cstdint>
#include <memory>
#include <string_view>

#include "depthfuse/config/numerics.hpp"
#include "depthfuse/numerics/field_registry.hpp"

namespace depthfuse {

/// Fixed-point value tagged with the class of the field it belongs to.
struct QuantizedValue {
  std::int64_t raw = 0;
  FieldClass field_class = FieldClass::Deterministic;

  bool operator==(const QuantizedValue& other) const {
    return raw == other.raw && field_class == other.field_class;
  }
  bool operator!=(const QuantizedValue& other) const {
    return !(*this == other);
  }
};

/**
 * @brief Abstract base class for fixed-point quantizers.
 *
 * Quantization pipeline, shared by every backend:
 *
 *   1. canonicalize: NaN/±Inf → 0 (warning), -0.0 → +0.0
 *   2. clamp to the representable range (warning, never fatal)
 *   3. roundScaled(value) → value × 2^F rounded half to even
 *
 * Backends differ only in step 3 and must agree bit for bit.
 */
class Quantizer {
 public:
  explicit Quantizer(const config::Quantization& cfg);
  virtual ~Quantizer() = default;

  /**
   * @brief Quantize a value to fixed point.
   *
   * @param value Input value
   * @param field Field name used in warnings
   * @return Raw fixed-point integer in [rawMin(), rawMax()]
   */
  std::int64_t quantize(double value, std::string_view field = "value") const;

  double dequantize(std::int64_t raw) const;

  /// True if a finite value lies outside [minValue(), maxValue()].
  bool overflows(double value) const;

  /// Smallest representable increment (2^-F).
  double step() const { return step_; }
  double maxValue() const { return max_value_; }
  double minValue() const { return min_value_; }
  std::int64_t rawMin() const { return raw_min_; }
  std::int64_t rawMax() const { return raw_max_; }
  int fractionalBits() const { return fractional_bits_; }

  virtual const char* name() const = 0;

 protected:
  /// value × 2^F rounded half to even. |value| ≤ range is guaranteed.
  virtual std::int64_t roundScaled(double value) const = 0;

  int fractional_bits_;
  double scale_;

 private:
  double step_;
  std::int64_t raw_min_;
  std::int64_t raw_max_;
  double min_value_;
  double max_value_;
};

/// Scale by 2^F (exact) and round with std::nearbyint.
class ArithmeticQuantizer : public Quantizer {
 public:
  explicit ArithmeticQuantizer(const config::Quantization& cfg)
      : Quantizer(cfg) {}

  const char* name() const override { return "arithmetic"; }

 protected:
  std::int64_t roundScaled(double value) const override;
};

/**
 * @brief Integer-only rounding from the IEEE-754 bit pattern.
 *
 * The 53-bit significand is shifted by (exponent + F) and rounded half to
 * even on the discarded bits. No floating-point rounding is involved.
 */
class IntegerQuantizer : public Quantizer {
 public:
  explicit IntegerQuantizer(const config::Quantization& cfg)
      : Quantizer(cfg) {}

  const char* name() const override { return "integer"; }

 protected:
  std::int64_t roundScaled(double value) const override;
};

/// Factory: create quantizer backend from config
std::unique_ptr<Quantizer> createQuantizer(const config::Quantization& cfg);

}  // namespace depthfuse

#endif  // DEPTHFUSE_NUMERICS_QUANTIZER_HPP
