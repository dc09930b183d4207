// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * frame_sequence.hpp
 *
 * Recorded frame sequences (YAML) for replay and verification.
 *
 *   frames:
 *     - timestamp: 0.0
 *       health: {lidar: 0.9, mono: 0.6}
 *       samples:
 *         - {source: lidar, depth: 2.01, confidence: 0.9}
 *         - {source: mono, depth: 1.95, confidence: invalid}
 *       variances: {anomaly_variance: 0.0001}
 *
 * A confidence of "invalid" or null maps to kInvalidConfidence. A sample
 * without a timestamp takes the frame's.
 */

#ifndef DEPTHFUSE_IO_FRAME_SEQUENCE_HPP
#define DEPTHFUSE_IO_FRAME_SEQUENCE_HPP

#include <string>
#include <vector>

#include "depthfuse/types.hpp"

namespace YAML {
class Node;
}

namespace depthfuse {

/// @throws std::invalid_argument on a malformed sequence
std::vector<FrameInput> parseFrames(const YAML::Node& root);

/// @throws std::runtime_error if the file cannot be read or parsed
std::vector<FrameInput> loadFrames(const std::string& path);

}  // namespace depthfuse

#endif  // DEPTHFUSE_IO_FRAME_SEQUENCE_HPP
