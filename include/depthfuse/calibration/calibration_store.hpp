// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * calibration_store.hpp
 *
 * Persisted per-source noise model calibration.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef DEPTHFUSE_CALIBRATION_CALIBRATION_STORE_HPP
#define DEPTHFUSE_CALIBRATION_CALIBRATION_STORE_HPP

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace depthfuse {

/// Fitted parameters as persisted. sigma_floor is configuration, not fitted.
struct StoredCalibration {
  double sigma_base = 0.0;
  double alpha = 0.0;
  double beta = 0.0;
};

/**
 * @brief Interface for calibration persistence.
 *
 * The fusion core reads and writes calibration only through this seam.
 * Implementations must be safe to call from a calibration thread while the
 * fusion thread reads.
 */
class CalibrationStore {
 public:
  using Ptr = std::shared_ptr<CalibrationStore>;

  virtual ~CalibrationStore() = default;

  virtual std::optional<StoredCalibration> load(
      const std::string& source_id) const = 0;

  virtual std::map<std::string, StoredCalibration> loadAll() const = 0;

  /**
   * @brief Replace one source's calibration.
   * @return false if the value could not be persisted
   */
  virtual bool replace(const std::string& source_id,
                       const StoredCalibration& calibration) = 0;
};

/// Process-local store. Contents are lost on exit.
class InMemoryCalibrationStore : public CalibrationStore {
 public:
  std::optional<StoredCalibration> load(
      const std::string& source_id) const override;
  std::map<std::string, StoredCalibration> loadAll() const override;
  bool replace(const std::string& source_id,
               const StoredCalibration& calibration) override;

 private:
  mutable std::mutex mutex_;
  std::map<std::string, StoredCalibration> data_;
};

/**
 * @brief YAML file store.
 *
 * File layout:
 *   sources:
 *     <source_id>: {sigma_base: .., alpha: .., beta: ..}
 *
 * The whole file is rewritten on every replace() through a temporary file
 * and rename, so readers never observe a partially written file.
 */
class YamlCalibrationStore : public CalibrationStore {
 public:
  /// Loads the file if it exists.
  /// @throws std::runtime_error if an existing file cannot be parsed
  explicit YamlCalibrationStore(std::string path);

  std::optional<StoredCalibration> load(
      const std::string& source_id) const override;
  std::map<std::string, StoredCalibration> loadAll() const override;
  bool replace(const std::string& source_id,
               const StoredCalibration& calibration) override;

  const std::string& path() const { return path_; }

 private:
  bool write(const std::map<std::string, StoredCalibration>& data) const;

  std::string path_;
  mutable std::mutex mutex_;
  std::map<std::string, StoredCalibration> data_;
};

}  // namespace depthfuse

#endif  // DEPTHFUSE_CALIBRATION_CALIBRATION_STORE_HPP
