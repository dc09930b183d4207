// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include <gtest/gtest.h>

#include "depthfuse/errors.hpp"
#include "depthfuse/fusion/fusion_arbitrator.hpp"
#include "depthfuse/numerics/field_registry.hpp"

using namespace depthfuse;

TEST(FieldRegistryTest, ClassifiesDefaultKeys) {
  FieldRegistry registry{config::Determinism{}};

  for (const char* key : {"noise_sigma", "effective_mean", "weight", "logit",
                          "gate", "final_quality", "uncertainty",
                          "uncertainty_penalty"}) {
    EXPECT_EQ(registry.classify(key), FieldClass::Deterministic) << key;
  }
  for (const char* key : {"latency", "timestamp", "device_id", "source_id",
                          "diagnostic_sampling"}) {
    EXPECT_EQ(registry.classify(key), FieldClass::Ignored) << key;
  }
}

TEST(FieldRegistryTest, QualifiedNamesUseBase) {
  FieldRegistry registry{config::Determinism{}};
  EXPECT_TRUE(registry.isDeterministic("noise_sigma/lidar"));
  EXPECT_TRUE(registry.isDeterministic("uncertainty/depth_variance"));
  EXPECT_FALSE(registry.isDeterministic("latency/fusion"));
  EXPECT_EQ(FieldRegistry::baseName("gate/stereo"), "gate");
  EXPECT_EQ(FieldRegistry::baseName("gate"), "gate");
}

TEST(FieldRegistryTest, UnknownFieldThrows) {
  FieldRegistry registry{config::Determinism{}};
  try {
    registry.classify("frame_rate");
    FAIL() << "expected UnknownDeterminismField";
  } catch (const UnknownDeterminismField& e) {
    EXPECT_EQ(e.field(), "frame_rate");
    EXPECT_EQ(e.component(), "FieldRegistry");
  }
}

TEST(FieldRegistryTest, OverlappingSetsThrow) {
  config::Determinism cfg;
  cfg.ignored_keys.insert("gate");
  EXPECT_THROW(FieldRegistry{cfg}, std::invalid_argument);
}

TEST(FieldRegistryTest, RequireChecksEveryField) {
  FieldRegistry registry{config::Determinism{}};
  EXPECT_NO_THROW(registry.require(FusionArbitrator::emittedFields()));
  EXPECT_THROW(registry.require({"gate", "jitter"}), UnknownDeterminismField);
}

TEST(FieldRegistryTest, ArbitratorRejectsUnclassifiedOutput) {
  Config cfg;
  cfg.determinism.keys.erase("logit");
  EXPECT_THROW(FusionArbitrator{cfg}, UnknownDeterminismField);
}

TEST(FieldRegistryTest, ReclassifiedFieldIsAccepted) {
  // Moving a field to the ignored set is a valid configuration
  Config cfg;
  cfg.determinism.keys.erase("logit");
  cfg.determinism.ignored_keys.insert("logit");
  EXPECT_NO_THROW(FusionArbitrator{cfg});
}
