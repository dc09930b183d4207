// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "depthfuse/fusion/frame_synchronizer.hpp"

using namespace depthfuse;
using namespace std::chrono_literals;

namespace {

SourceSample sample(const std::string& id, double timestamp,
                    double depth = 2.0) {
  SourceSample s;
  s.source_id = id;
  s.timestamp = timestamp;
  s.depth = depth;
  s.confidence = 0.9;
  return s;
}

config::Synchronizer makeConfig(std::size_t buffer_size = 8) {
  config::Synchronizer cfg;
  cfg.sources = {"a", "b", "c"};
  cfg.sync_tolerance = 0.05;
  cfg.buffer_size = buffer_size;
  return cfg;
}

}  // namespace

// ─── Barrier ─────────────────────────────────────────────────────────────────

TEST(FrameSynchronizerTest, RequiresSources) {
  EXPECT_THROW(FrameSynchronizer{config::Synchronizer{}},
               std::invalid_argument);
}

TEST(FrameSynchronizerTest, WaitsForEverySource) {
  FrameSynchronizer sync(makeConfig());
  EXPECT_TRUE(sync.submit(sample("a", 0.0)));
  EXPECT_TRUE(sync.submit(sample("b", 0.0)));
  EXPECT_FALSE(sync.tryAssemble().has_value());

  EXPECT_TRUE(sync.submit(sample("c", 0.01)));
  auto frame = sync.tryAssemble();
  ASSERT_TRUE(frame.has_value());
  ASSERT_EQ(frame->samples.size(), 3u);
  EXPECT_EQ(frame->samples[0].source_id, "a");
  EXPECT_EQ(frame->samples[1].source_id, "b");
  EXPECT_EQ(frame->samples[2].source_id, "c");
  EXPECT_DOUBLE_EQ(frame->timestamp, 0.01);

  EXPECT_EQ(sync.pending("a"), 0u);
  EXPECT_FALSE(sync.tryAssemble().has_value());
  EXPECT_EQ(sync.statistics().frames_assembled, 1u);
}

TEST(FrameSynchronizerTest, RejectsUnexpectedSource) {
  FrameSynchronizer sync(makeConfig());
  EXPECT_FALSE(sync.submit(sample("radar", 0.0)));
  EXPECT_EQ(sync.pending("radar"), 0u);
  EXPECT_EQ(sync.statistics().samples_rejected, 1u);
}

TEST(FrameSynchronizerTest, DropsStaleSamples) {
  FrameSynchronizer sync(makeConfig());
  sync.submit(sample("a", 0.0, 1.0));
  sync.submit(sample("a", 0.1, 1.5));
  sync.submit(sample("b", 0.1));
  sync.submit(sample("c", 0.1));

  auto frame = sync.tryAssemble();
  ASSERT_TRUE(frame.has_value());
  EXPECT_DOUBLE_EQ(frame->samples[0].depth, 1.5);
  EXPECT_EQ(sync.statistics().samples_dropped, 1u);
}

TEST(FrameSynchronizerTest, BoundedBufferDropsOldest) {
  FrameSynchronizer sync(makeConfig(2));
  sync.submit(sample("a", 0.00, 1.0));
  sync.submit(sample("a", 0.01, 1.1));
  sync.submit(sample("a", 0.02, 1.2));
  EXPECT_EQ(sync.pending("a"), 2u);
  EXPECT_EQ(sync.statistics().samples_dropped, 1u);

  sync.submit(sample("b", 0.02));
  sync.submit(sample("c", 0.02));
  auto frame = sync.tryAssemble();
  ASSERT_TRUE(frame.has_value());
  EXPECT_DOUBLE_EQ(frame->samples[0].depth, 1.1);
}

TEST(FrameSynchronizerTest, HealthPersistsAcrossFrames) {
  FrameSynchronizer sync(makeConfig());
  sync.reportHealth("a", 0.9);
  sync.reportHealth("b", 0.4);

  for (int i = 0; i < 2; ++i) {
    const double t = 0.1 * i;
    sync.submit(sample("a", t));
    sync.submit(sample("b", t));
    sync.submit(sample("c", t));
    auto frame = sync.tryAssemble();
    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(frame->health.at("a"), 0.9);
    EXPECT_EQ(frame->health.at("b"), 0.4);
    EXPECT_EQ(frame->health.count("c"), 0u);
  }
}

// ─── Blocking ────────────────────────────────────────────────────────────────

TEST(FrameSynchronizerTest, WaitTimesOut) {
  FrameSynchronizer sync(makeConfig());
  sync.submit(sample("a", 0.0));

  const auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(sync.waitForFrame(20ms).has_value());
  EXPECT_GE(std::chrono::steady_clock::now() - start, 20ms);
}

TEST(FrameSynchronizerTest, WaitWakesOnSubmit) {
  FrameSynchronizer sync(makeConfig());
  sync.submit(sample("a", 0.0));
  sync.submit(sample("b", 0.0));

  std::thread producer([&sync] {
    std::this_thread::sleep_for(10ms);
    sync.submit(sample("c", 0.0));
  });
  auto frame = sync.waitForFrame(5s);
  producer.join();

  ASSERT_TRUE(frame.has_value());
  EXPECT_EQ(frame->samples.size(), 3u);
}

TEST(FrameSynchronizerTest, ConcurrentProducers) {
  constexpr int kFrames = 50;
  FrameSynchronizer sync(makeConfig(64));

  std::vector<std::thread> producers;
  for (const std::string id : {"a", "b", "c"}) {
    producers.emplace_back([&sync, id] {
      for (int i = 0; i < kFrames; ++i) {
        sync.reportHealth(id, 0.8);
        sync.submit(sample(id, 0.1 * i));
      }
    });
  }
  for (auto& t : producers) t.join();

  int assembled = 0;
  while (auto frame = sync.tryAssemble()) {
    ASSERT_EQ(frame->samples.size(), 3u);
    for (const auto& s : frame->samples) {
      EXPECT_DOUBLE_EQ(s.timestamp, frame->timestamp);
    }
    ++assembled;
  }
  EXPECT_EQ(assembled, kFrames);
  EXPECT_EQ(sync.statistics().samples_dropped, 0u);
}
