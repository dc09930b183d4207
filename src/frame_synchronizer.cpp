// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "depthfuse/fusion/frame_synchronizer.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

namespace depthfuse {

FrameSynchronizer::FrameSynchronizer(const config::Synchronizer& cfg)
    : cfg_(cfg) {
  if (cfg_.sources.empty()) {
    throw std::invalid_argument(
        "[FrameSynchronizer] At least one source must be configured");
  }
  for (const auto& id : cfg_.sources) buffers_[id];
}

bool FrameSynchronizer::submit(const SourceSample& sample) {
  {
    std::lock_guard lock(mutex_);
    auto it = buffers_.find(sample.source_id);
    if (it == buffers_.end()) {
      ++stats_.samples_rejected;
      spdlog::warn("[FrameSynchronizer] Unexpected source '{}', dropping",
                   sample.source_id);
      return false;
    }

    auto& buffer = it->second;
    buffer.push_back(sample);
    while (buffer.size() > cfg_.buffer_size) {
      buffer.pop_front();
      ++stats_.samples_dropped;
      spdlog::debug("[FrameSynchronizer] Buffer full for '{}', dropped oldest",
                    sample.source_id);
    }
  }
  cv_.notify_all();
  return true;
}

void FrameSynchronizer::reportHealth(const std::string& source_id,
                                     double health) {
  std::lock_guard lock(mutex_);
  health_[source_id] = health;
}

std::optional<FrameInput> FrameSynchronizer::assembleLocked() {
  // Drop stale fronts until all candidates lie within the tolerance window.
  // Each pass either drops a sample or terminates.
  double newest = 0.0;
  while (true) {
    bool first = true;
    for (const auto& [id, buffer] : buffers_) {
      if (buffer.empty()) return std::nullopt;
      newest = first ? buffer.front().timestamp
                     : std::max(newest, buffer.front().timestamp);
      first = false;
    }

    bool dropped = false;
    for (auto& [id, buffer] : buffers_) {
      while (!buffer.empty() &&
             buffer.front().timestamp < newest - cfg_.sync_tolerance) {
        spdlog::debug(
            "[FrameSynchronizer] Dropping stale sample from '{}' ({:.3f}s "
            "behind)",
            id, newest - buffer.front().timestamp);
        buffer.pop_front();
        ++stats_.samples_dropped;
        dropped = true;
      }
    }
    if (!dropped) break;
  }

  FrameInput frame;
  frame.timestamp = newest;
  for (auto& [id, buffer] : buffers_) {
    frame.samples.push_back(buffer.front());
    buffer.pop_front();
    auto h = health_.find(id);
    if (h != health_.end()) frame.health[id] = h->second;
  }
  ++stats_.frames_assembled;
  return frame;
}

std::optional<FrameInput> FrameSynchronizer::tryAssemble() {
  std::lock_guard lock(mutex_);
  return assembleLocked();
}

std::optional<FrameInput> FrameSynchronizer::waitForFrame(
    std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  std::unique_lock lock(mutex_);
  while (true) {
    if (auto frame = assembleLocked()) return frame;
    if (cv_.wait_until(lock, deadline) == std::cv_status::timeout) {
      return assembleLocked();
    }
  }
}

std::size_t FrameSynchronizer::pending(const std::string& source_id) const {
  std::lock_guard lock(mutex_);
  auto it = buffers_.find(source_id);
  return it == buffers_.end() ? 0 : it->second.size();
}

FrameSynchronizer::Statistics FrameSynchronizer::statistics() const {
  std::lock_guard lock(mutex_);
  return stats_;
}

}  // namespace depthfuse
