// SPDX-FileCopyrightText: 2025 Stuart Parmenter
// SPDX-License-Identifier: MIT

// @file frame_decoder.cpp
// @brief Serial frame protocol decoder

#include "frame_decoder.h"

namespace ledmatrix {

FrameDecoder::FrameDecoder(FrameExchange &exchange)
    : exchange_(exchange), fill_pattern_(FrameBuffer::gradient(Color::BLUE)), receive_(exchange.acquire()) {
  *receive_ = FrameBuffer();
}

LEDMATRIX_IRAM void FrameDecoder::on_byte(uint8_t byte) {
  if (byte == SYNC_BYTE) {
    cursor_ = 0;
    resyncs_.fetch_add(1, std::memory_order_relaxed);
    return;
  }

  if (cursor_ >= FRAME_BYTES) {
    return;
  }

  const size_t pixel = cursor_ / 3;
  const uint8_t channel = cursor_ % 3;
  const uint8_t row = pixel / MATRIX_SIZE + 1;
  const uint8_t col = pixel % MATRIX_SIZE + 1;
  receive_->set_channel(row, col, channel, byte);

  if (++cursor_ == FRAME_BYTES) {
    complete_frame();
  }
}

LEDMATRIX_IRAM void FrameDecoder::complete_frame() {
  receive_ = exchange_.publish(receive_);
  *receive_ = fill_pattern_;
  cursor_ = 0;
  frames_completed_.fetch_add(1, std::memory_order_relaxed);
}

}  // namespace ledmatrix
