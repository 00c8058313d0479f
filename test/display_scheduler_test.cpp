// SPDX-FileCopyrightText: 2025 Stuart Parmenter
// SPDX-License-Identifier: MIT
//
// @file display_scheduler_test.cpp
// @brief Row cadence, deadline arithmetic and frame swap timing

#include "core/display_scheduler.h"
#include "color/color_lut.h"
#include "support/mutex_section.h"
#include "support/recording_bus.h"
#include <gtest/gtest.h>
#include <chrono>

using namespace ledmatrix;
using ledmatrix::test::MutexSection;
using ledmatrix::test::RecordingBus;

namespace {

constexpr size_t ROW_BITS = MATRIX_SIZE * 3 * 8;

}  // namespace

class DisplaySchedulerTest : public ::testing::Test {
 protected:
  // Publish a frame the way the decoder does
  void publish(const FrameBuffer &frame) {
    FrameBuffer *buffer = exchange.acquire();
    *buffer = frame;
    FrameBuffer *fresh = exchange.publish(buffer);
    exchange_spare = fresh;
  }

  Instant tick() {
    bus.clear();
    deadline = scheduler.tick(deadline);
    return deadline;
  }

  // First shifted byte of the last tick, i.e. blue of column 8
  uint8_t last_row_first_byte() const { return bus.shifted_bytes()[0]; }

  RecordingBus bus;
  MatrixDriver driver{bus};
  BufferPool pool;
  MutexSection lock;
  FrameExchange exchange{pool, lock};
  DisplayScheduler scheduler{exchange, driver};
  FrameBuffer *exchange_spare = nullptr;
  Instant deadline{0};
};

TEST_F(DisplaySchedulerTest, StartsBlackAtRowOne) {
  EXPECT_EQ(scheduler.next_row(), 1);
  EXPECT_EQ(scheduler.current(), FrameBuffer());
}

TEST_F(DisplaySchedulerTest, RowsCycleOneThroughEight) {
  for (int n = 0; n < 3 * MATRIX_SIZE + 5; n++) {
    EXPECT_EQ(scheduler.next_row(), n % MATRIX_SIZE + 1);
    tick();
    EXPECT_TRUE(bus.level(row_line(n % MATRIX_SIZE + 1)));
    EXPECT_EQ(bus.bits().size(), ROW_BITS);
  }
}

TEST_F(DisplaySchedulerTest, DeadlinesAdvanceByExactlyOnePeriod) {
  const Instant first = tick();
  EXPECT_EQ(first - Instant{0}, DisplayScheduler::ROW_PERIOD);

  for (uint32_t n = 1; n < ROW_RATE_HZ; n++) {
    tick();
  }
  // One second of rows lands on one second, with no accumulated error
  EXPECT_EQ(deadline, Instant{std::chrono::seconds(1)});
}

TEST_F(DisplaySchedulerTest, LateTicksDoNotDrift) {
  // The caller always passes back the returned deadline, however late it ran
  const Instant start{std::chrono::microseconds(123456)};
  deadline = start;
  for (int n = 0; n < 100; n++) {
    tick();
  }
  EXPECT_EQ(deadline - start, 100 * DisplayScheduler::ROW_PERIOD);
}

TEST_F(DisplaySchedulerTest, PendingFrameSwapsOnlyAtRowOne) {
  tick();  // row 1, still black
  publish(FrameBuffer::solid(Color::RED));
  ASSERT_TRUE(exchange.has_pending());

  for (int row = 2; row <= MATRIX_SIZE; row++) {
    tick();
    EXPECT_EQ(scheduler.current(), FrameBuffer());
    EXPECT_EQ(last_row_first_byte(), 0);
  }
  EXPECT_TRUE(exchange.has_pending());

  tick();  // row 1 again
  EXPECT_FALSE(exchange.has_pending());
  EXPECT_EQ(scheduler.current(), FrameBuffer::solid(Color::RED));
  // B, G, R of column 8: red lands in the third byte
  const std::vector<uint8_t> bytes = bus.shifted_bytes();
  EXPECT_EQ(bytes[0], 0);
  EXPECT_EQ(bytes[2], get_lut()[255]);
}

TEST_F(DisplaySchedulerTest, RepeatsCurrentFrameWithoutNewData) {
  publish(FrameBuffer::solid(Color::GREEN));
  for (int n = 0; n < 4 * MATRIX_SIZE; n++) {
    tick();
    EXPECT_EQ(scheduler.current(), FrameBuffer::solid(Color::GREEN));
  }
  // Scheduler holds one buffer, the spare receive buffer another
  EXPECT_EQ(pool.available(), 1u);
  EXPECT_NE(exchange_spare, nullptr);
}
