// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "depthfuse/calibration/calibration_store.hpp"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <utility>

namespace depthfuse {

// ─── InMemoryCalibrationStore ───────────────────────────────────────────────

std::optional<StoredCalibration> InMemoryCalibrationStore::load(
    const std::string& source_id) const {
  std::lock_guard lock(mutex_);
  auto it = data_.find(source_id);
  if (it == data_.end()) return std::nullopt;
  return it->second;
}

std::map<std::string, StoredCalibration> InMemoryCalibrationStore::loadAll()
    const {
  std::lock_guard lock(mutex_);
  return data_;
}

bool InMemoryCalibrationStore::replace(const std::string& source_id,
                                       const StoredCalibration& calibration) {
  std::lock_guard lock(mutex_);
  data_[source_id] = calibration;
  return true;
}

// ─── YamlCalibrationStore ───────────────────────────────────────────────────

YamlCalibrationStore::YamlCalibrationStore(std::string path)
    : path_(std::move(path)) {
  if (!std::ifstream(path_).good()) {
    spdlog::info("[CalibrationStore] {} not found, starting empty", path_);
    return;
  }

  try {
    const YAML::Node root = YAML::LoadFile(path_);
    if (auto sources = root["sources"]) {
      for (const auto& entry : sources) {
        StoredCalibration c;
        c.sigma_base = entry.second["sigma_base"].as<double>();
        c.alpha = entry.second["alpha"].as<double>();
        c.beta = entry.second["beta"].as<double>();
        data_[entry.first.as<std::string>()] = c;
      }
    }
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to load calibration: " + path_ + " - " +
                             e.what());
  }
  spdlog::info("[CalibrationStore] Loaded {} source(s) from {}", data_.size(),
               path_);
}

std::optional<StoredCalibration> YamlCalibrationStore::load(
    const std::string& source_id) const {
  std::lock_guard lock(mutex_);
  auto it = data_.find(source_id);
  if (it == data_.end()) return std::nullopt;
  return it->second;
}

std::map<std::string, StoredCalibration> YamlCalibrationStore::loadAll() const {
  std::lock_guard lock(mutex_);
  return data_;
}

bool YamlCalibrationStore::replace(const std::string& source_id,
                                   const StoredCalibration& calibration) {
  std::lock_guard lock(mutex_);
  auto next = data_;
  next[source_id] = calibration;
  if (!write(next)) return false;
  data_ = std::move(next);
  return true;
}

bool YamlCalibrationStore::write(
    const std::map<std::string, StoredCalibration>& data) const {
  YAML::Emitter out;
  out.SetDoublePrecision(17);
  out << YAML::BeginMap << YAML::Key << "sources" << YAML::Value
      << YAML::BeginMap;
  for (const auto& [id, c] : data) {
    out << YAML::Key << id << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "sigma_base" << YAML::Value << c.sigma_base;
    out << YAML::Key << "alpha" << YAML::Value << c.alpha;
    out << YAML::Key << "beta" << YAML::Value << c.beta;
    out << YAML::EndMap;
  }
  out << YAML::EndMap << YAML::EndMap;

  const std::string tmp_path = path_ + ".tmp";
  {
    std::ofstream fs(tmp_path);
    if (!fs.is_open()) {
      spdlog::error("[CalibrationStore] Cannot create {}", tmp_path);
      return false;
    }
    fs << out.c_str() << "\n";
    if (!fs.good()) {
      spdlog::error("[CalibrationStore] Write to {} failed", tmp_path);
      return false;
    }
  }
  if (std::rename(tmp_path.c_str(), path_.c_str()) != 0) {
    spdlog::error("[CalibrationStore] Cannot move {} to {}", tmp_path, path_);
    std::remove(tmp_path.c_str());
    return false;
  }
  return true;
}

}  // namespace depthfuse
