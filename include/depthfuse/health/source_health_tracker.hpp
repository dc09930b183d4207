// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef DEPTHFUSE_HEALTH_SOURCE_HEALTH_TRACKER_HPP
#define DEPTHFUSE_HEALTH_SOURCE_HEALTH_TRACKER_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "depthfuse/health/soft_gate.hpp"

namespace depthfuse {

/**
 * @brief Owns the source_id → SourceHealthState map.
 *
 * States are created lazily on the first observation of a source.
 * Single writer: call from the fusion thread only.
 */
class SourceHealthTracker {
 public:
  explicit SourceHealthTracker(const config::SoftGate& cfg = {});

  /// Advance one frame for a source. Returns the updated state.
  const SourceHealthState& update(const std::string& source_id, double health);

  /// Advance one frame for a source. Returns the gate in [0, 1].
  double computeGate(const std::string& source_id, double health) {
    return update(source_id, health).smoothed_gate;
  }

  std::optional<SourceHealthState> state(const std::string& source_id) const;

  /// Current gate; 0 for a source never observed.
  double gate(const std::string& source_id) const;

  bool isHardDisabled(const std::string& source_id) const;

  /// Forget one source. Its next observation starts from a fresh state.
  void reset(const std::string& source_id);
  void clear() { states_.clear(); }

  std::vector<std::string> sources() const;
  std::size_t size() const { return states_.size(); }

  const SoftGateComputer& computer() const { return computer_; }

 private:
  SoftGateComputer computer_;
  std::map<std::string, SourceHealthState> states_;
};

}  // namespace depthfuse

#endif  // DEPTHFUSE_HEALTH_SOURCE_HEALTH_TRACKER_HPP
