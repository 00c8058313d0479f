// SPDX-FileCopyrightText: 2025 Stuart Parmenter
// SPDX-License-Identifier: MIT
//
// @file matrix_bus.h
// @brief Digital line interface between the matrix driver and the hardware
//
// The driver only ever needs "set line high/low" and "wait N ms". Each
// platform maps the logical lines below onto its own GPIOs.

#pragma once

#include <stdint.h>

namespace ledmatrix {

/**
 * @brief Logical output lines of the matrix driver chip
 */
enum class MatrixLine : uint8_t {
  SCK,  // Shift clock
  SDA,  // Serial data
  LAT,  // Latch
  SB,   // Bank select / blank
  RST,  // Reset (active low)
  C0,   // Row 1 select
  C1,
  C2,
  C3,
  C4,
  C5,
  C6,
  C7,   // Row 8 select
};

constexpr uint8_t MATRIX_LINE_COUNT = static_cast<uint8_t>(MatrixLine::C7) + 1;

class MatrixBus {
 public:
  virtual ~MatrixBus() = default;

  /**
   * @brief Drive one line high or low
   */
  virtual void set_line(MatrixLine line, bool high) = 0;

  /**
   * @brief Block for at least @p ms milliseconds
   */
  virtual void delay_ms(uint32_t ms) = 0;
};

}  // namespace ledmatrix
