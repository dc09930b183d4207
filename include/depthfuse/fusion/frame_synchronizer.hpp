// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * frame_synchronizer.hpp
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef DEPTHFUSE_FUSION_FRAME_SYNCHRONIZER_HPP
#define DEPTHFUSE_FUSION_FRAME_SYNCHRONIZER_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "depthfuse/config/synchronizer.hpp"
#include "depthfuse/types.hpp"

namespace depthfuse {

/**
 * @brief Barrier that joins per-source samples into complete frames.
 *
 * Source pipelines call submit() and reportHealth() from their own
 * threads. A frame is assembled only once every configured source has a
 * buffered sample; samples older than sync_tolerance behind the newest
 * candidate are dropped. The frame carries the most recent health reported
 * for each source.
 *
 * Buffers are bounded: on overflow the oldest sample is dropped.
 */
class FrameSynchronizer {
 public:
  struct Statistics {
    std::uint64_t frames_assembled = 0;
    std::uint64_t samples_dropped = 0;   ///< Stale or overflowed
    std::uint64_t samples_rejected = 0;  ///< Unknown source
  };

  /// @throws std::invalid_argument if no source is configured
  explicit FrameSynchronizer(const config::Synchronizer& cfg);

  /// @return false if the source is not configured
  bool submit(const SourceSample& sample);

  void reportHealth(const std::string& source_id, double health);

  /// Non-blocking assembly.
  std::optional<FrameInput> tryAssemble();

  /// Block until a frame is assembled or the timeout expires.
  std::optional<FrameInput> waitForFrame(std::chrono::milliseconds timeout);

  std::size_t pending(const std::string& source_id) const;
  Statistics statistics() const;

  const config::Synchronizer& config() const { return cfg_; }

 private:
  std::optional<FrameInput> assembleLocked();

  config::Synchronizer cfg_;
  std::map<std::string, std::deque<SourceSample>> buffers_;
  std::map<std::string, double> health_;
  Statistics stats_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
};

}  // namespace depthfuse

#endif  // DEPTHFUSE_FUSION_FRAME_SYNCHRONIZER_HPP
