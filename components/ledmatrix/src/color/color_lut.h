// SPDX-FileCopyrightText: 2025 Stuart Parmenter
// SPDX-License-Identifier: MIT
//
// @file color_lut.h
// @brief Gamma lookup table with compile-time generation
//
// CIE 1931 lightness lookup tables adapted from:
// - https://ledshield.wordpress.com/2012/11/13/led-brightness-to-your-eye-gamma-correction-no/
// - https://gist.github.com/mathiasvr/19ce1d7b6caeab230934080ae1f1380e
//
// Formula: CIE 1931 lightness curve
//   For L ≤ 8:    Y = L / 902.3
//   For L > 8:    Y = ((L + 16) / 116)³
//   Where L = input brightness (0-100), Y = output luminance (0-1)
//
// The driver chip takes 8-bit channel values, so every table maps 0-255 to 0-255.

#pragma once

#include "ledmatrix_config.h"
#include <stdint.h>
#include <array>

namespace ledmatrix {

// ============================================================================
// Compile-Time Math Helpers
// ============================================================================

/**
 * @brief Compile-time rounding
 * std::lround not constexpr until C++23
 */
constexpr int constexpr_round(double x) {
  // NOLINTNEXTLINE(bugprone-incorrect-roundings)
  return (x >= 0.0) ? static_cast<int>(x + 0.5) : static_cast<int>(x - 0.5);
}

/**
 * @brief Compile-time clamp function
 */
constexpr int constexpr_clamp(int value, int min_val, int max_val) {
  return (value < min_val) ? min_val : (value > max_val) ? max_val : value;
}

/**
 * @brief Compile-time fifth root for x in [0, 1] (Newton-Raphson)
 */
constexpr double constexpr_root5(double x) {
  if (x <= 0.0) {
    return 0.0;
  }
  double y = 1.0;
  for (int i = 0; i < 60; i++) {
    const double y4 = y * y * y * y;
    y -= (y4 * y - x) / (5.0 * y4);
  }
  return y;
}

// ============================================================================
// Curve Generation
// ============================================================================

/**
 * @brief CIE 1931 lightness formula (constexpr)
 * @param lightness Lightness value (0-100)
 */
constexpr double cie1931(double lightness) {
  if (lightness <= 8.0) {
    return lightness / 902.3;
  } else {
    const double temp = (lightness + 16.0) / 116.0;
    return temp * temp * temp;  // Cube
  }
}

/**
 * @brief Generate CIE 1931 lookup table at compile time
 */
constexpr std::array<uint8_t, 256> generate_cie1931_lut() {
  std::array<uint8_t, 256> lut{};
  for (int i = 0; i < 256; i++) {
    const double lightness = (i / 255.0) * 100.0;
    const int rounded = constexpr_round(cie1931(lightness) * 255.0);
    lut[i] = static_cast<uint8_t>(constexpr_clamp(rounded, 0, 255));
  }
  return lut;
}

/**
 * @brief Generate Gamma 2.2 lookup table at compile time
 * x^2.2 is evaluated as x² · x^(1/5)
 */
constexpr std::array<uint8_t, 256> generate_gamma22_lut() {
  std::array<uint8_t, 256> lut{};
  for (int i = 0; i < 256; i++) {
    const double normalized = i / 255.0;
    const double corrected = normalized * normalized * constexpr_root5(normalized);
    const int rounded = constexpr_round(corrected * 255.0);
    lut[i] = static_cast<uint8_t>(constexpr_clamp(rounded, 0, 255));
  }
  return lut;
}

/**
 * @brief Generate identity lookup table at compile time
 */
constexpr std::array<uint8_t, 256> generate_linear_lut() {
  std::array<uint8_t, 256> lut{};
  for (int i = 0; i < 256; i++) {
    lut[i] = static_cast<uint8_t>(i);
  }
  return lut;
}

/**
 * @brief Get active lookup table (compile-time selected)
 *
 * Returns the 256-entry table for the curve configured at compile time
 * via LEDMATRIX_GAMMA_MODE.
 */
LEDMATRIX_WARN_UNUSED const uint8_t *get_lut() noexcept;

}  // namespace ledmatrix
