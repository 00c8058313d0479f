// SPDX-FileCopyrightText: 2025 Stuart Parmenter
// SPDX-License-Identifier: MIT

// @file frame_buffer.cpp
// @brief Frame construction and byte serialization

#include "frame_buffer.h"

namespace ledmatrix {

FrameBuffer FrameBuffer::solid(Color color) {
  FrameBuffer frame;
  frame.cells_.fill(color);
  return frame;
}

FrameBuffer FrameBuffer::gradient(Color color) {
  FrameBuffer frame;
  for (uint8_t row = 1; row <= MATRIX_SIZE; row++) {
    for (uint8_t col = 1; col <= MATRIX_SIZE; col++) {
      frame.at(row, col) = gradient_at(color, row, col);
    }
  }
  return frame;
}

LEDMATRIX_IRAM void FrameBuffer::set_channel(uint8_t row, uint8_t col, uint8_t channel, uint8_t value) {
  Color &cell = at(row, col);
  switch (channel) {
    case 0:
      cell.r = value;
      break;
    case 1:
      cell.g = value;
      break;
    case 2:
      cell.b = value;
      break;
    default:
      invariant_violation("FrameBuffer: channel out of range");
  }
}

void FrameBuffer::to_bytes(uint8_t *out) const {
  for (const Color &cell : cells_) {
    *out++ = cell.r;
    *out++ = cell.g;
    *out++ = cell.b;
  }
}

void FrameBuffer::from_bytes(const uint8_t *in) {
  for (Color &cell : cells_) {
    cell.r = *in++;
    cell.g = *in++;
    cell.b = *in++;
  }
}

}  // namespace ledmatrix
