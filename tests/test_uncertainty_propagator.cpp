// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

#include "depthfuse/uncertainty/uncertainty_propagator.hpp"

using namespace depthfuse;

// ─── Correlated groups ───────────────────────────────────────────────────────

TEST(UncertaintyPropagatorTest, CorrelatedPairContributesMax) {
  UncertaintyPropagator propagator;
  auto est = propagator.propagate(
      {{"depth_variance", 0.04}, {"source_disagreement_variance", 0.09}});

  EXPECT_DOUBLE_EQ(est.total_variance, 0.09);
  EXPECT_DOUBLE_EQ(est.correlated_variance, 0.09);
  EXPECT_DOUBLE_EQ(est.independent_variance, 0.0);
}

TEST(UncertaintyPropagatorTest, PairsSharingMemberMerge) {
  UncertaintyPropagator propagator;
  propagator.addCorrelatedPair("source_disagreement_variance",
                               "temporal_variance");

  EXPECT_TRUE(propagator.areCorrelated("depth_variance", "temporal_variance"));
  auto est = propagator.propagate({{"depth_variance", 0.01},
                                   {"source_disagreement_variance", 0.02},
                                   {"temporal_variance", 0.05}});
  EXPECT_DOUBLE_EQ(est.total_variance, 0.05);
  EXPECT_EQ(propagator.correlatedGroups().size(), 1u);
}

TEST(UncertaintyPropagatorTest, GroupsIndependentOfInsertionOrder) {
  config::Uncertainty cfg;
  cfg.correlated_pairs = {{"a", "b"}, {"c", "d"}, {"b", "c"}};
  UncertaintyPropagator forward(cfg);
  cfg.correlated_pairs = {{"c", "b"}, {"d", "c"}, {"b", "a"}};
  UncertaintyPropagator backward(cfg);

  EXPECT_EQ(forward.correlatedGroups(), backward.correlatedGroups());
  EXPECT_TRUE(backward.areCorrelated("a", "d"));
}

TEST(UncertaintyPropagatorTest, EmptyRegistryTreatsAllAsIndependent) {
  config::Uncertainty cfg;
  cfg.correlated_pairs.clear();
  UncertaintyPropagator propagator(cfg);

  EXPECT_FALSE(
      propagator.areCorrelated("depth_variance", "source_disagreement_variance"));
  auto est = propagator.propagate(
      {{"depth_variance", 0.04}, {"source_disagreement_variance", 0.09}});
  // 0.04 + 0.09 + 2 × 0.3 × 0.2 × 0.3
  EXPECT_NEAR(est.total_variance, 0.166, 1e-12);
}

// ─── Independent combination ─────────────────────────────────────────────────

TEST(UncertaintyPropagatorTest, IndependentContributionsWithResidualCorrelation) {
  UncertaintyPropagator propagator;
  auto est = propagator.propagate(
      {{"anomaly_variance", 0.04}, {"temporal_variance", 0.09}});
  EXPECT_NEAR(est.independent_variance, 0.166, 1e-12);
  EXPECT_NEAR(est.total_uncertainty, std::sqrt(0.166), 1e-12);
}

TEST(UncertaintyPropagatorTest, MixedGroupsAndIndependent) {
  UncertaintyPropagator propagator;
  auto est = propagator.propagate({{"depth_variance", 0.01},
                                   {"source_disagreement_variance", 0.0025},
                                   {"temporal_variance", 0.0004}});
  EXPECT_DOUBLE_EQ(est.correlated_variance, 0.01);
  EXPECT_DOUBLE_EQ(est.independent_variance, 0.0004);
  EXPECT_NEAR(est.total_variance, 0.0104, 1e-15);
}

TEST(UncertaintyPropagatorTest, InvalidContributionsCountAsZero) {
  UncertaintyPropagator propagator;
  auto est = propagator.propagate(
      {{"anomaly_variance", -0.5},
       {"temporal_variance", std::numeric_limits<double>::quiet_NaN()},
       {"depth_variance", 0.01}});
  EXPECT_DOUBLE_EQ(est.total_variance, 0.01);
}

TEST(UncertaintyPropagatorTest, EmptyInput) {
  UncertaintyPropagator propagator;
  auto est = propagator.propagate({});
  EXPECT_EQ(est.total_variance, 0.0);
  EXPECT_EQ(est.penalty, 1.0);
}

// ─── Penalty ─────────────────────────────────────────────────────────────────

TEST(UncertaintyPropagatorTest, PenaltyIsClamped) {
  UncertaintyPropagator propagator;
  EXPECT_DOUBLE_EQ(propagator.penalty(0.0), 1.0);
  EXPECT_DOUBLE_EQ(propagator.penalty(0.1), 0.8);
  EXPECT_DOUBLE_EQ(propagator.penalty(0.25), 0.5);
  EXPECT_DOUBLE_EQ(propagator.penalty(10.0), 0.5);
}

TEST(UncertaintyPropagatorTest, PenaltyFollowsTotalUncertainty) {
  UncertaintyPropagator propagator;
  auto est = propagator.propagate({{"depth_variance", 0.0016}});
  EXPECT_NEAR(est.total_uncertainty, 0.04, 1e-15);
  EXPECT_NEAR(est.penalty, 0.92, 1e-14);
}
