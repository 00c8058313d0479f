// SPDX-FileCopyrightText: 2025 Stuart Parmenter
// SPDX-License-Identifier: MIT

// @file display_scheduler.h
// @brief Row-at-a-time refresh with absolute deadlines

#pragma once

#include "../drivers/matrix_driver.h"
#include "../frame/frame_buffer.h"
#include "../frame/frame_exchange.h"
#include "ledmatrix_config.h"
#include <stdint.h>
#include <chrono>
#include <ratio>
#include <type_traits>

namespace ledmatrix {

constexpr uint32_t ROW_RATE_HZ = MATRIX_SIZE * LEDMATRIX_TARGET_FPS;

// One row slot: exactly 1 s / (8 * fps)
using RowPeriod = std::chrono::duration<int64_t, std::ratio<1, ROW_RATE_HZ>>;

// Time since boot, in a unit that represents both microseconds and row
// periods exactly, so deadlines never accumulate rounding error
using Instant = std::common_type_t<std::chrono::microseconds, RowPeriod>;

/**
 * @brief Periodic row emission, one row per tick
 *
 * At the first row of every frame the pending frame (if any) is swapped in,
 * so a frame is always shown whole. The caller re-arms its timer for the
 * returned deadline, which is derived from the previous deadline rather than
 * from the current time so late ticks do not drift the refresh rate.
 */
class DisplayScheduler {
 public:
  static constexpr RowPeriod ROW_PERIOD{1};

  /**
   * @brief Take the initial (black) display buffer from the exchange
   */
  DisplayScheduler(FrameExchange &exchange, MatrixDriver &driver);

  DisplayScheduler(const DisplayScheduler &) = delete;
  DisplayScheduler &operator=(const DisplayScheduler &) = delete;

  /**
   * @brief Emit the next row
   * @param deadline Absolute time this tick was scheduled for
   * @return Absolute time of the next tick
   */
  LEDMATRIX_WARN_UNUSED Instant tick(Instant deadline);

  /**
   * @brief Row the next tick will emit, 1..8
   */
  uint8_t next_row() const { return next_row_; }

  /**
   * @brief Frame currently on display
   */
  const FrameBuffer &current() const { return *current_; }

 private:
  FrameExchange &exchange_;
  MatrixDriver &driver_;
  FrameBuffer *current_;
  uint8_t next_row_ = 1;
};

static_assert(std::chrono::seconds(1) == RowPeriod(ROW_RATE_HZ), "Row period must divide one second exactly");

}  // namespace ledmatrix
