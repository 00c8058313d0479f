// SPDX-FileCopyrightText: 2025 Stuart Parmenter
// SPDX-License-Identifier: MIT

// @file color.cpp
// @brief Color arithmetic and gamma correction

#include "color.h"
#include "color_lut.h"
#include <algorithm>
#include <cmath>

namespace ledmatrix {

namespace {

uint8_t scale_channel(uint8_t channel, float factor) {
  const float scaled = std::clamp(static_cast<float>(channel) * factor, 0.0f, 255.0f);
  return static_cast<uint8_t>(std::lround(scaled));
}

uint8_t gradient_channel(uint8_t base, uint8_t row, uint8_t col) {
  const float divisor = 1.0f + static_cast<float>(row * row + col);
  return static_cast<uint8_t>(static_cast<float>(base) / divisor);
}

}  // namespace

LEDMATRIX_IRAM Color Color::gamma_correct() const {
  const uint8_t *lut = get_lut();
  return {lut[r], lut[g], lut[b]};
}

Color Color::operator*(float factor) const {
  return {scale_channel(r, factor), scale_channel(g, factor), scale_channel(b, factor)};
}

Color Color::operator/(float divisor) const { return *this * (1.0f / divisor); }

Color gradient_at(Color base, uint8_t row, uint8_t col) {
  return {gradient_channel(base.r, row, col), gradient_channel(base.g, row, col), gradient_channel(base.b, row, col)};
}

}  // namespace ledmatrix
