// SPDX-FileCopyrightText: 2025 Stuart Parmenter
// SPDX-License-Identifier: MIT

// @file frame_buffer.h
// @brief Fixed 8x8 frame with 1-based addressing and a raw byte view

#pragma once

#include "../color/color.h"
#include "ledmatrix_config.h"
#include "ledmatrix_internal.h"
#include <stddef.h>
#include <stdint.h>
#include <array>

namespace ledmatrix {

// Panel geometry (fixed)
constexpr uint8_t MATRIX_SIZE = 8;
constexpr size_t FRAME_PIXELS = MATRIX_SIZE * MATRIX_SIZE;
constexpr size_t FRAME_BYTES = FRAME_PIXELS * 3;

/**
 * @brief One full frame of 64 colors, stored row-major
 *
 * Public coordinates are 1-based (row, col) in 1..8, matching the wire
 * protocol numbering. Storage is a flat 0-based array.
 */
class FrameBuffer {
 public:
  FrameBuffer() = default;

  /**
   * @brief Frame with every cell set to one color
   */
  static FrameBuffer solid(Color color);

  /**
   * @brief Diagnostic gradient, brightest at (1, 1)
   */
  static FrameBuffer gradient(Color color);

  /**
   * @brief Convert 1-based (row, col) to the flat storage index
   *
   * Out-of-range coordinates are a programming error and stop the system.
   */
  static constexpr size_t index_of(uint8_t row, uint8_t col) {
    if (row < 1 || row > MATRIX_SIZE || col < 1 || col > MATRIX_SIZE) {
      invariant_violation("FrameBuffer: coordinate out of range");
    }
    return static_cast<size_t>(row - 1) * MATRIX_SIZE + (col - 1);
  }

  Color &at(uint8_t row, uint8_t col) { return cells_[index_of(row, col)]; }
  const Color &at(uint8_t row, uint8_t col) const { return cells_[index_of(row, col)]; }

  /**
   * @brief Write one channel of one pixel
   * @param channel 0 = red, 1 = green, 2 = blue
   */
  void set_channel(uint8_t row, uint8_t col, uint8_t channel, uint8_t value);

  /**
   * @brief The 8 contiguous colors of a row, columns 1..8
   * @param row Row number, 1..8
   */
  const Color *row(uint8_t row) const { return &cells_[index_of(row, 1)]; }

  // ========================================================================
  // Raw Byte View
  // ========================================================================
  //
  // Exactly FRAME_BYTES bytes: row-major, then column, then channel r, g, b.
  // No validation happens here; callers keep the layout intact.

  void to_bytes(uint8_t *out) const;
  void from_bytes(const uint8_t *in);

  bool operator==(const FrameBuffer &other) const = default;

 private:
  std::array<Color, FRAME_PIXELS> cells_{};
};

// ============================================================================
// Compile-Time Validation
// ============================================================================

namespace {

// First and last cells land at both ends of storage
consteval bool test_index_corners() {
  return FrameBuffer::index_of(1, 1) == 0 && FrameBuffer::index_of(8, 8) == FRAME_PIXELS - 1;
}

// Rows are contiguous runs of MATRIX_SIZE cells
consteval bool test_index_row_major() {
  return FrameBuffer::index_of(2, 1) == MATRIX_SIZE && FrameBuffer::index_of(1, 8) == MATRIX_SIZE - 1;
}

static_assert(test_index_corners(), "1-based corners must map to the ends of storage");
static_assert(test_index_row_major(), "Frame storage must be row-major");
static_assert(FRAME_BYTES == 192, "Wire frame is 64 pixels of 3 bytes");

}  // namespace

}  // namespace ledmatrix
