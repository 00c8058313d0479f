// SPDX-FileCopyrightText: 2025 Stuart Parmenter
// SPDX-License-Identifier: MIT

// @file buffer_pool.h
// @brief Fixed-capacity pool of preallocated frame buffers

#pragma once

#include "frame_buffer.h"
#include "ledmatrix_config.h"
#include <stddef.h>
#include <array>

namespace ledmatrix {

/**
 * @brief Three frame buffers, allocated once, recycled forever
 *
 * At most three frames are ever live at once: the one being displayed, the
 * one being received, and one completed frame waiting for display. Running
 * out of slots means that protocol was broken, so it is fatal.
 *
 * Not internally synchronized; FrameExchange serializes access.
 */
class BufferPool {
 public:
  static constexpr size_t CAPACITY = 3;

  /**
   * @brief Grow the pool to full capacity, every slot free
   */
  BufferPool();

  BufferPool(const BufferPool &) = delete;
  BufferPool &operator=(const BufferPool &) = delete;

  /**
   * @brief Take exclusive ownership of a free slot
   * @return Never null; exhaustion stops the system
   */
  LEDMATRIX_WARN_UNUSED FrameBuffer *allocate();

  /**
   * @brief Return a slot obtained from allocate()
   */
  void free(FrameBuffer *buffer);

  /**
   * @brief Number of slots currently free
   */
  size_t available() const { return free_count_; }

 private:
  bool owns(const FrameBuffer *buffer) const;

  std::array<FrameBuffer, CAPACITY> slots_{};
  std::array<FrameBuffer *, CAPACITY> free_list_{};
  size_t free_count_ = 0;
};

}  // namespace ledmatrix
