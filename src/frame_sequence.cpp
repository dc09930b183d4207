// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "depthfuse/io/frame_sequence.hpp"

#include <yaml-cpp/yaml.h>

#include <stdexcept>
#include <utility>

namespace depthfuse {

namespace {

double parseConfidence(const YAML::Node& node) {
  if (!node || node.IsNull()) return kInvalidConfidence;
  if (node.IsScalar() && node.Scalar() == "invalid") return kInvalidConfidence;
  return node.as<double>();
}

std::map<std::string, double> parseScalarMap(const YAML::Node& node) {
  std::map<std::string, double> out;
  if (!node) return out;
  for (const auto& entry : node) {
    out[entry.first.as<std::string>()] = entry.second.as<double>();
  }
  return out;
}

}  // namespace

std::vector<FrameInput> parseFrames(const YAML::Node& root) {
  const auto frames = root["frames"];
  if (!frames || !frames.IsSequence()) {
    throw std::invalid_argument("frame sequence: missing 'frames' list");
  }

  std::vector<FrameInput> out;
  out.reserve(frames.size());
  for (const auto& f : frames) {
    FrameInput frame;
    if (f["timestamp"]) frame.timestamp = f["timestamp"].as<double>();
    frame.health = parseScalarMap(f["health"]);
    frame.extra_variances = parseScalarMap(f["variances"]);

    if (auto samples = f["samples"]) {
      for (const auto& s : samples) {
        if (!s["source"] || !s["depth"]) {
          throw std::invalid_argument(
              "frame sequence: sample needs 'source' and 'depth'");
        }
        SourceSample sample;
        sample.source_id = s["source"].as<std::string>();
        sample.depth = s["depth"].as<double>();
        sample.confidence = parseConfidence(s["confidence"]);
        sample.timestamp =
            s["timestamp"] ? s["timestamp"].as<double>() : frame.timestamp;
        frame.samples.push_back(std::move(sample));
      }
    }
    out.push_back(std::move(frame));
  }
  return out;
}

std::vector<FrameInput> loadFrames(const std::string& path) {
  try {
    return parseFrames(YAML::LoadFile(path));
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to load frames: " + path + " - " +
                             e.what());
  }
}

}  // namespace depthfuse
