// SPDX-FileCopyrightText: 2025 Stuart Parmenter
// SPDX-License-Identifier: MIT
//
// @file pipeline_test.cpp
// @brief Bytes in on the serial side, bits out on the matrix side

#include "core/display_scheduler.h"
#include "protocol/frame_decoder.h"
#include "color/color_lut.h"
#include "support/mutex_section.h"
#include "support/recording_bus.h"
#include <gtest/gtest.h>
#include <vector>

using namespace ledmatrix;
using ledmatrix::test::MutexSection;
using ledmatrix::test::RecordingBus;

class PipelineTest : public ::testing::Test {
 protected:
  void send_frame(uint8_t value) {
    for (size_t i = 0; i < FRAME_BYTES; i++) {
      decoder.on_byte(value);
    }
  }

  void tick() {
    bus.clear();
    deadline = scheduler.tick(deadline);
  }

  RecordingBus bus;
  MatrixDriver driver{bus};
  BufferPool pool;
  MutexSection lock;
  FrameExchange exchange{pool, lock};
  FrameDecoder decoder{exchange};
  DisplayScheduler scheduler{exchange, driver};
  Instant deadline{0};
};

TEST_F(PipelineTest, ReceivedFrameReachesTheMatrix) {
  send_frame(5);
  tick();

  const Color *row = scheduler.current().row(1);
  for (uint8_t col = 0; col < MATRIX_SIZE; col++) {
    EXPECT_EQ(row[col], (Color{5, 5, 5}));
  }
  const std::vector<uint8_t> expected(MATRIX_SIZE * 3, get_lut()[5]);
  EXPECT_EQ(bus.shifted_bytes(), expected);
}

TEST_F(PipelineTest, FrameArrivingMidRefreshWaitsForRowOne) {
  send_frame(10);
  for (int n = 0; n < 3; n++) {
    tick();
  }
  send_frame(20);

  for (int row = 4; row <= MATRIX_SIZE; row++) {
    tick();
    EXPECT_EQ(scheduler.current().at(row, 1), (Color{10, 10, 10}));
    EXPECT_EQ(bus.shifted_bytes()[0], get_lut()[10]);
  }

  tick();
  EXPECT_EQ(scheduler.current(), FrameBuffer::solid(Color{20, 20, 20}));
  EXPECT_EQ(bus.shifted_bytes()[0], get_lut()[20]);
}

TEST_F(PipelineTest, PoolNeverLeaksUnderSustainedTraffic) {
  for (int frame = 0; frame < 50; frame++) {
    send_frame(static_cast<uint8_t>(frame));
    if (frame % 3 == 0) {
      decoder.on_byte(FrameDecoder::SYNC_BYTE);
    }
    for (int n = 0; n < frame % 11; n++) {
      tick();
    }
    // Display and receive buffers are always held; the third is either
    // pending or free
    EXPECT_EQ(pool.available(), exchange.has_pending() ? 0u : 1u);
  }
  EXPECT_EQ(decoder.frames_completed(), 50u);
}
