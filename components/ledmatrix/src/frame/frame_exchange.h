// SPDX-FileCopyrightText: 2025 Stuart Parmenter
// SPDX-License-Identifier: MIT

// @file frame_exchange.h
// @brief Single-slot handoff of completed frames from decoder to scheduler

#pragma once

#include "buffer_pool.h"
#include "frame_buffer.h"
#include "../platforms/critical_section.h"
#include "ledmatrix_config.h"

namespace ledmatrix {

/**
 * @brief Newest-frame-wins exchange between receiver and display
 *
 * Holds at most one pending frame. Publishing a new frame while one is
 * still pending drops the older one back to the pool; frames are never
 * queued. All pool and slot access happens under the shared critical
 * section.
 */
class FrameExchange {
 public:
  FrameExchange(BufferPool &pool, CriticalSection &lock);

  FrameExchange(const FrameExchange &) = delete;
  FrameExchange &operator=(const FrameExchange &) = delete;

  /**
   * @brief Take a buffer from the pool (startup ownership of current/receive)
   */
  LEDMATRIX_WARN_UNUSED FrameBuffer *acquire();

  /**
   * @brief Decoder side: hand over a completed frame
   *
   * Any pending frame that was never displayed is freed, @p completed
   * becomes pending, and a fresh buffer is taken from the pool.
   *
   * @param completed Fully received frame, ownership passes to the exchange
   * @return New receive buffer (contents unspecified)
   */
  LEDMATRIX_WARN_UNUSED FrameBuffer *publish(FrameBuffer *completed);

  /**
   * @brief Scheduler side: swap in the pending frame if there is one
   *
   * @param current Frame currently on display, ownership passes in
   * @return Frame to display from now on; if a pending frame was taken,
   *         @p current has been returned to the pool
   */
  LEDMATRIX_WARN_UNUSED FrameBuffer *take_pending(FrameBuffer *current);

  /**
   * @brief Whether a completed frame is waiting for display
   */
  bool has_pending() const;

 private:
  BufferPool &pool_;
  CriticalSection &lock_;
  FrameBuffer *pending_ = nullptr;
};

}  // namespace ledmatrix
