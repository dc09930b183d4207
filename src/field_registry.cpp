// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "depthfuse/numerics/field_registry.hpp"

#include <stdexcept>

#include "depthfuse/errors.hpp"

namespace depthfuse {

FieldRegistry::FieldRegistry(const config::Determinism& cfg)
    : keys_(cfg.keys.begin(), cfg.keys.end()),
      ignored_keys_(cfg.ignored_keys.begin(), cfg.ignored_keys.end()) {
  for (const auto& key : keys_) {
    if (ignored_keys_.count(key)) {
      throw std::invalid_argument("[FieldRegistry] Field '" + key +
                                  "' is both a determinism key and ignored");
    }
  }
}

std::string_view FieldRegistry::baseName(std::string_view field) {
  const auto slash = field.find('/');
  return slash == std::string_view::npos ? field : field.substr(0, slash);
}

FieldClass FieldRegistry::classify(std::string_view field) const {
  const auto base = baseName(field);
  if (keys_.find(base) != keys_.end()) return FieldClass::Deterministic;
  if (ignored_keys_.find(base) != ignored_keys_.end()) {
    return FieldClass::Ignored;
  }
  throw UnknownDeterminismField(std::string(field));
}

void FieldRegistry::require(const std::vector<std::string>& fields) const {
  for (const auto& field : fields) classify(field);
}

}  // namespace depthfuse
