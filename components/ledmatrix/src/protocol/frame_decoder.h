// SPDX-FileCopyrightText: 2025 Stuart Parmenter
// SPDX-License-Identifier: MIT

// @file frame_decoder.h
// @brief Byte-at-a-time decoder for the serial frame protocol
//
// Wire format:
//   64 pixels × 3 bytes, row-major starting at (1, 1). Byte k of a frame
//   is channel k % 3 (r, g, b) of pixel k / 3.
//   0xFF is never pixel data: it resets the write cursor to 0.
//   A frame is complete when the cursor reaches 192; there is no trailer.

#pragma once

#include "../frame/frame_buffer.h"
#include "../frame/frame_exchange.h"
#include "ledmatrix_config.h"
#include <stddef.h>
#include <stdint.h>
#include <atomic>

namespace ledmatrix {

class FrameDecoder {
 public:
  static constexpr uint8_t SYNC_BYTE = 0xFF;

  /**
   * @brief Take the initial receive buffer from the exchange
   */
  explicit FrameDecoder(FrameExchange &exchange);

  FrameDecoder(const FrameDecoder &) = delete;
  FrameDecoder &operator=(const FrameDecoder &) = delete;

  /**
   * @brief Consume one received byte
   *
   * Runs at the highest priority for every byte: bounded work, never
   * blocks, only touches the pool through the exchange.
   */
  void on_byte(uint8_t byte);

  /**
   * @brief Position of the next byte within the frame, 0..191
   */
  size_t cursor() const { return cursor_; }

  // Safe to read from any task
  uint32_t frames_completed() const { return frames_completed_.load(std::memory_order_relaxed); }
  uint32_t resyncs() const { return resyncs_.load(std::memory_order_relaxed); }

  /**
   * @brief Frame currently being filled
   */
  const FrameBuffer &receiving() const { return *receive_; }

 private:
  void complete_frame();

  FrameExchange &exchange_;
  // Fresh receive buffers start visibly patterned so a stalled link is obvious
  const FrameBuffer fill_pattern_;
  FrameBuffer *receive_;
  size_t cursor_ = 0;
  std::atomic<uint32_t> frames_completed_{0};
  std::atomic<uint32_t> resyncs_{0};
};

}  // namespace ledmatrix
