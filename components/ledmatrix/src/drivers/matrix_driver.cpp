// SPDX-FileCopyrightText: 2025 Stuart Parmenter
// SPDX-License-Identifier: MIT

// @file matrix_driver.cpp
// @brief Matrix shift register protocol

#include "matrix_driver.h"

namespace ledmatrix {

MatrixDriver::MatrixDriver(MatrixBus &bus) : bus_(bus) {
  // 1. Idle levels: SB and LAT high, everything else low
  bus_.set_line(MatrixLine::SB, true);
  bus_.set_line(MatrixLine::LAT, true);
  bus_.set_line(MatrixLine::RST, false);
  bus_.set_line(MatrixLine::SCK, false);
  bus_.set_line(MatrixLine::SDA, false);
  for (uint8_t row = 1; row <= MATRIX_SIZE; row++) {
    set_row(row, false);
  }

  // 2. Hold reset while supplies settle
  bus_.delay_ms(RESET_SETTLE_MS);
  bus_.set_line(MatrixLine::RST, true);

  // 3. Arm bank 0
  bank_init();
}

void MatrixDriver::bank_init() {
  bus_.set_line(MatrixLine::SB, false);
  for (uint16_t i = 0; i < BANK0_BITS; i++) {
    bus_.set_line(MatrixLine::SDA, true);
    pulse_sck();
  }
  pulse_lat();
  bus_.set_line(MatrixLine::SB, true);
}

LEDMATRIX_IRAM void MatrixDriver::pulse_sck() {
  bus_.set_line(MatrixLine::SCK, true);
  bus_.set_line(MatrixLine::SCK, false);
}

LEDMATRIX_IRAM void MatrixDriver::pulse_lat() {
  bus_.set_line(MatrixLine::LAT, false);
  bus_.set_line(MatrixLine::LAT, true);
}

LEDMATRIX_IRAM void MatrixDriver::send_byte(uint8_t value) {
  for (int bit = 7; bit >= 0; bit--) {
    bus_.set_line(MatrixLine::SDA, (value >> bit) & 1);
    pulse_sck();
  }
}

LEDMATRIX_IRAM void MatrixDriver::set_row(uint8_t row, bool on) { bus_.set_line(row_line(row), on); }

LEDMATRIX_IRAM void MatrixDriver::send_row(uint8_t row, const Color *pixels) {
  for (uint8_t i = 0; i < MATRIX_SIZE; i++) {
    const Color pixel = pixels[MATRIX_SIZE - 1 - i].gamma_correct();
    send_byte(pixel.b);
    send_byte(pixel.g);
    if (i == 4) {
      // Previous row off while the rest of this one is still shifting in
      set_row((row + 7) % 8, false);
    }
    send_byte(pixel.r);
  }
  pulse_lat();
  set_row(row, true);
}

void MatrixDriver::display_full(const FrameBuffer &frame) {
  for (uint8_t row = 1; row <= MATRIX_SIZE; row++) {
    send_row(row, frame.row(row));
  }
}

}  // namespace ledmatrix
