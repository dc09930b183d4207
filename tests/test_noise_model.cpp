// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include <gtest/gtest.h>

#include <atomic>
#include <limits>
#include <thread>

#include "depthfuse/calibration/calibration_store.hpp"
#include "depthfuse/noise/noise_model.hpp"
#include "depthfuse/types.hpp"

using namespace depthfuse;

// ─── Helpers ─────────────────────────────────────────────────────────────────

namespace {

config::NoiseModel makeConfig() {
  config::NoiseModel cfg;
  NoiseModelParameters lidar;
  lidar.sigma_base = 0.01;
  lidar.alpha = 1.0;
  lidar.beta = 0.3;
  lidar.sigma_floor = 0.002;
  cfg.sources["lidar"] = lidar;

  // Tiny sigma_base so the floor binds across most of the grid
  NoiseModelParameters tight;
  tight.sigma_base = 0.001;
  tight.alpha = 0.5;
  tight.beta = 0.9;
  tight.sigma_floor = 0.004;
  cfg.sources["tight"] = tight;
  return cfg;
}

}  // namespace

// ─── Validity ────────────────────────────────────────────────────────────────

TEST(NoiseModelTest, InvalidConfidenceHasNoSigma) {
  NoiseModel model;
  EXPECT_FALSE(model.sigma(2.0, 0.0, "a").has_value());
  EXPECT_FALSE(model.sigma(2.0, -0.3, "a").has_value());
  EXPECT_FALSE(model.sigma(2.0, kInvalidConfidence, "a").has_value());
  EXPECT_FALSE(
      model.sigma(std::numeric_limits<double>::infinity(), 0.5, "a").has_value());
  EXPECT_TRUE(model.sigma(2.0, 1e-9, "a").has_value());
}

TEST(NoiseModelTest, FormulaAtReferenceDepth) {
  NoiseModel model;
  // 0.02 × 1 × (1 − 0.5 × 1.0)
  EXPECT_NEAR(*model.sigma(2.0, 1.0, "a"), 0.01, 1e-15);
  // 0.02 × 2^1.5 × (1 − 0.5 × 0.5)
  EXPECT_NEAR(*model.sigma(4.0, 0.5, "a"), 0.02 * 2.8284271247461903 * 0.75,
              1e-14);
}

TEST(NoiseModelTest, ConfidenceBelowFloorIsClamped) {
  NoiseModel model;
  EXPECT_EQ(*model.sigma(3.0, 0.01, "a"), *model.sigma(3.0, 0.1, "a"));
  EXPECT_EQ(*model.sigma(3.0, 1.7, "a"), *model.sigma(3.0, 1.0, "a"));
}

TEST(NoiseModelTest, DepthClampedBeforePowerLaw) {
  NoiseModel model;
  const auto at_min = model.sigma(1e-3, 0.5, "a");
  EXPECT_EQ(*model.sigma(0.0, 0.5, "a"), *at_min);
  EXPECT_EQ(*model.sigma(-1.0, 0.5, "a"), *at_min);
}

// ─── Floor & monotonicity ────────────────────────────────────────────────────

TEST(NoiseModelTest, SigmaNeverBelowFloor) {
  NoiseModel model(makeConfig());
  for (const std::string id : {"unknown", "lidar", "tight"}) {
    const double floor = model.parameters(id).sigma_floor;
    for (double d = 0.1; d <= 20.0; d += 0.1) {
      for (double c = 0.05; c <= 1.0; c += 0.05) {
        EXPECT_GE(*model.sigma(d, c, id), floor) << id << " d=" << d;
      }
    }
  }
}

TEST(NoiseModelTest, MonotoneInDepthAndConfidence) {
  NoiseModel model(makeConfig());
  for (const std::string id : {"unknown", "lidar", "tight"}) {
    for (double c = 0.05; c <= 1.0; c += 0.05) {
      double prev = *model.sigma(0.1, c, id);
      for (double d = 0.2; d <= 20.0; d += 0.1) {
        const double s = *model.sigma(d, c, id);
        EXPECT_GE(s, prev) << id << " d=" << d << " c=" << c;
        prev = s;
      }
    }
    for (double d = 0.5; d <= 20.0; d += 0.5) {
      double prev = *model.sigma(d, 0.05, id);
      for (double c = 0.1; c <= 1.0; c += 0.05) {
        const double s = *model.sigma(d, c, id);
        EXPECT_LE(s, prev) << id << " d=" << d << " c=" << c;
        prev = s;
      }
    }
  }
}

// ─── Parameters ──────────────────────────────────────────────────────────────

TEST(NoiseModelTest, UnknownSourceUsesDefaults) {
  NoiseModel model(makeConfig());
  EXPECT_DOUBLE_EQ(model.parameters("radar").sigma_base, 0.02);
  EXPECT_DOUBLE_EQ(model.parameters("lidar").sigma_base, 0.01);
}

TEST(NoiseModelTest, ReplacementDoesNotAffectOldSnapshot) {
  NoiseModel model(makeConfig());
  auto before = model.snapshot();

  NoiseModelParameters p = model.parameters("lidar");
  p.sigma_base = 0.05;
  model.replaceParameters("lidar", p);

  EXPECT_DOUBLE_EQ(model.parametersIn(*before, "lidar").sigma_base, 0.01);
  EXPECT_DOUBLE_EQ(model.parameters("lidar").sigma_base, 0.05);
  EXPECT_DOUBLE_EQ(model.parameters("tight").sigma_base, 0.001);
}

TEST(NoiseModelTest, ReplaceAllSwapsTable) {
  NoiseModel model(makeConfig());
  NoiseModel::ParameterTable table;
  table["stereo"] = NoiseModelParameters{0.03, 1.2, 0.4, 0.006};
  model.replaceAll(table);

  EXPECT_DOUBLE_EQ(model.parameters("stereo").sigma_base, 0.03);
  EXPECT_DOUBLE_EQ(model.parameters("lidar").sigma_base, 0.02);  // default
}

TEST(NoiseModelTest, LoadFromStoreKeepsFloor) {
  NoiseModel model(makeConfig());
  InMemoryCalibrationStore store;
  store.replace("lidar", {0.015, 1.1, 0.2});
  store.replace("radar", {0.04, 2.0, 0.1});

  EXPECT_EQ(model.loadFrom(store), 2u);
  const auto lidar = model.parameters("lidar");
  EXPECT_DOUBLE_EQ(lidar.sigma_base, 0.015);
  EXPECT_DOUBLE_EQ(lidar.alpha, 1.1);
  EXPECT_DOUBLE_EQ(lidar.beta, 0.2);
  EXPECT_DOUBLE_EQ(lidar.sigma_floor, 0.002);
  EXPECT_DOUBLE_EQ(model.parameters("radar").sigma_floor, 0.005);
}

TEST(NoiseModelTest, ConcurrentReplacementKeepsSnapshotsConsistent) {
  NoiseModel model;
  NoiseModel::ParameterTable a, b;
  a["s1"] = a["s2"] = NoiseModelParameters{0.01, 1.0, 0.5, 0.001};
  b["s1"] = b["s2"] = NoiseModelParameters{0.03, 2.0, 0.2, 0.001};
  model.replaceAll(a);

  std::atomic<bool> stop{false};
  std::thread writer([&] {
    for (int i = 0; i < 2000; ++i) model.replaceAll(i % 2 ? a : b);
    stop = true;
  });

  int inconsistent = 0;
  while (!stop) {
    auto table = model.snapshot();
    if (model.parametersIn(*table, "s1").sigma_base !=
        model.parametersIn(*table, "s2").sigma_base) {
      ++inconsistent;
    }
  }
  writer.join();
  EXPECT_EQ(inconsistent, 0);
}
