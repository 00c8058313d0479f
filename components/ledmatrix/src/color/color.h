// SPDX-FileCopyrightText: 2025 Stuart Parmenter
// SPDX-License-Identifier: MIT

// @file color.h
// @brief RGB888 color value with gamma correction and clamped scaling

#pragma once

#include "ledmatrix_config.h"
#include <stdint.h>

namespace ledmatrix {

/**
 * @brief One pixel, 8 bits per channel
 *
 * Channel order r, g, b is also the order used on the wire and in the
 * frame byte view.
 */
struct Color {
  uint8_t r = 0;
  uint8_t g = 0;
  uint8_t b = 0;

  static const Color BLACK;
  static const Color RED;
  static const Color GREEN;
  static const Color BLUE;
  static const Color WHITE;

  /**
   * @brief Apply the configured gamma curve to each channel
   */
  Color gamma_correct() const;

  /**
   * @brief Scale every channel by a non-negative factor
   * @return round(clamp(channel * factor, 0, 255)) per channel
   */
  Color operator*(float factor) const;

  /**
   * @brief Divide every channel, defined as multiplication by 1 / divisor
   */
  Color operator/(float divisor) const;

  bool operator==(const Color &other) const = default;
};

inline constexpr Color Color::BLACK{0, 0, 0};
inline constexpr Color Color::RED{255, 0, 0};
inline constexpr Color Color::GREEN{0, 255, 0};
inline constexpr Color Color::BLUE{0, 0, 255};
inline constexpr Color Color::WHITE{255, 255, 255};

/**
 * @brief Diagnostic gradient value at a 1-based (row, col)
 *
 * Each channel is base / (1 + row² + col), truncated. (1, 1) is the
 * brightest cell and intensity never increases as row² + col grows.
 */
LEDMATRIX_CONST Color gradient_at(Color base, uint8_t row, uint8_t col);

}  // namespace ledmatrix
