// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * errors.hpp
 *
 * Exception hierarchy for conditions that abort an operation.
 *
 *   Error (base)
 *   ├── InsufficientCalibrationData - calibration aborted, prior parameters kept
 *   └── UnknownDeterminismField     - field tagged into neither key set (fatal)
 *
 * Conditions that are part of normal operation are not exceptions:
 * invalid samples yield std::nullopt from the noise model, a frame without
 * any contributing source yields std::nullopt from the arbitrator, and
 * out-of-range fixed-point values are clamped with a warning.
 */

#ifndef DEPTHFUSE_ERRORS_HPP
#define DEPTHFUSE_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace depthfuse {

/**
 * @brief Base exception for depthfuse errors.
 */
class Error : public std::runtime_error {
 public:
  Error(const std::string& component, const std::string& message)
      : std::runtime_error("[" + component + "] " + message),
        component_(component) {}

  const std::string& component() const noexcept { return component_; }

 private:
  std::string component_;
};

/**
 * @brief Calibration fit requested with fewer samples than required.
 */
class InsufficientCalibrationData : public Error {
 public:
  InsufficientCalibrationData(const std::string& source_id, std::size_t count,
                              std::size_t required)
      : Error("Calibration", "Source '" + source_id + "' has " +
                                 std::to_string(count) +
                                 " usable samples, at least " +
                                 std::to_string(required) + " required"),
        source_id_(source_id),
        count_(count),
        required_(required) {}

  const std::string& sourceId() const noexcept { return source_id_; }
  std::size_t count() const noexcept { return count_; }
  std::size_t required() const noexcept { return required_; }

 private:
  std::string source_id_;
  std::size_t count_;
  std::size_t required_;
};

/**
 * @brief Output field that belongs to neither the determinism-key nor the
 * ignored-key set.
 *
 * Raised while wiring components together, never from the per-frame path.
 */
class UnknownDeterminismField : public Error {
 public:
  explicit UnknownDeterminismField(const std::string& field)
      : Error("FieldRegistry",
              "Field '" + field +
                  "' is in neither the determinism-key nor the ignored-key set"),
        field_(field) {}

  const std::string& field() const noexcept { return field_; }

 private:
  std::string field_;
};

}  // namespace depthfuse

#endif  // DEPTHFUSE_ERRORS_HPP
