// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * field_registry.hpp
 *
 * Closed classification of output fields into determinism-key fields
 * (bit-identical across platforms) and ignored fields.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef DEPTHFUSE_NUMERICS_FIELD_REGISTRY_HPP
#define DEPTHFUSE_NUMERICS_FIELD_REGISTRY_HPP

#include <functional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "depthfuse/config/numerics.hpp"

namespace depthfuse {

enum class FieldClass { Deterministic, Ignored };

/**
 * @brief Maps field names to their FieldClass.
 *
 * Names may be qualified as "base/qualifier" (e.g. "noise_sigma/lidar");
 * the base name decides the class. A field in neither set is a wiring
 * error and throws UnknownDeterminismField.
 */
class FieldRegistry {
 public:
  using KeySet = std::set<std::string, std::less<>>;

  /// @throws std::invalid_argument if the key sets overlap
  explicit FieldRegistry(const config::Determinism& cfg);

  /// @throws UnknownDeterminismField
  FieldClass classify(std::string_view field) const;

  /// @throws UnknownDeterminismField
  bool isDeterministic(std::string_view field) const {
    return classify(field) == FieldClass::Deterministic;
  }

  /// Check every field a component will emit. Throws on the first
  /// unclassified one.
  void require(const std::vector<std::string>& fields) const;

  const KeySet& keys() const { return keys_; }
  const KeySet& ignoredKeys() const { return ignored_keys_; }

  /// "noise_sigma/lidar" → "noise_sigma"
  static std::string_view baseName(std::string_view field);

 private:
  KeySet keys_;
  KeySet ignored_keys_;
};

}  // namespace depthfuse

#endif  // DEPTHFUSE_NUMERICS_FIELD_REGISTRY_HPP
