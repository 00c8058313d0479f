// SPDX-FileCopyrightText: 2025 Stuart Parmenter
// SPDX-License-Identifier: MIT

// @file matrix_driver.h
// @brief Bit-banged shift/latch/row-select driver for the 8x8 RGB matrix

#pragma once

#include "matrix_bus.h"
#include "../color/color.h"
#include "../frame/frame_buffer.h"
#include "ledmatrix_config.h"
#include <stdint.h>

namespace ledmatrix {

/**
 * @brief Row select line for a 1-based row
 *
 * Rows 1..8 map to C0..C7. Any other index falls back to C7: send_row
 * relies on this to reach row 8 as the row preceding row 1, since
 * (1 + 7) % 8 == 0.
 */
LEDMATRIX_CONST constexpr MatrixLine row_line(uint8_t row) {
  if (row >= 1 && row <= MATRIX_SIZE) {
    return static_cast<MatrixLine>(static_cast<uint8_t>(MatrixLine::C0) + row - 1);
  }
  return MatrixLine::C7;
}

/**
 * @brief Drives the LED chip through a MatrixBus
 *
 * Every bit the driver emits is self-generated, so nothing here can fail.
 */
class MatrixDriver {
 public:
  // One-bits clocked into bank 0 at startup
  static constexpr uint16_t BANK0_BITS = 144;
  static constexpr uint32_t RESET_SETTLE_MS = 100;

  /**
   * @brief Bring the chip up
   *
   * SB and LAT start high, every other line low. After 100 ms RST is
   * released and bank 0 is initialized. The bus lines must already be
   * configured as outputs.
   */
  explicit MatrixDriver(MatrixBus &bus);

  MatrixDriver(const MatrixDriver &) = delete;
  MatrixDriver &operator=(const MatrixDriver &) = delete;

  /**
   * @brief Shift out one row and light it
   *
   * Pixels are sent last column first, each gamma-corrected and sent as
   * B, G, R bytes, MSB first. Midway through (between the green and red
   * bytes of the fifth pixel sent) the previously lit row is switched
   * off to avoid smear. LAT is then pulsed and @p row switched on.
   *
   * @param row Row number, 1..8
   * @param pixels MATRIX_SIZE colors, columns 1..8
   */
  void send_row(uint8_t row, const Color *pixels);

  /**
   * @brief Send all 8 rows back to back (diagnostics only)
   */
  void display_full(const FrameBuffer &frame);

 private:
  void bank_init();
  void pulse_sck();
  void pulse_lat();
  void send_byte(uint8_t value);
  void set_row(uint8_t row, bool on);

  MatrixBus &bus_;
};

// ============================================================================
// Compile-Time Validation
// ============================================================================

namespace {

consteval bool test_row_line_mapping() {
  for (uint8_t row = 1; row <= MATRIX_SIZE; row++) {
    if (static_cast<uint8_t>(row_line(row)) != static_cast<uint8_t>(MatrixLine::C0) + row - 1) {
      return false;
    }
  }
  return true;
}

// Row preceding row 1 is computed as index 0 and must land on row 8
consteval bool test_row_line_wraps_to_last() { return row_line((1 + 7) % 8) == MatrixLine::C7; }

static_assert(test_row_line_mapping(), "Rows 1..8 must map to C0..C7");
static_assert(test_row_line_wraps_to_last(), "Out-of-range rows must fall back to C7");

}  // namespace

}  // namespace ledmatrix
