// SPDX-FileCopyrightText: 2025 Stuart Parmenter
// SPDX-License-Identifier: MIT

// @file color_lut.cpp
// @brief Compile-time selection and validation of the gamma table

#include "color_lut.h"
#include <cstddef>

namespace ledmatrix {

// ============================================================================
// Compile-Time LUT Selection (LEDMATRIX_GAMMA_MODE)
// ============================================================================

#if LEDMATRIX_GAMMA_MODE == 0  // LINEAR/NONE
constexpr auto LUT = generate_linear_lut();
#elif LEDMATRIX_GAMMA_MODE == 1  // CIE1931
constexpr auto LUT = generate_cie1931_lut();
#elif LEDMATRIX_GAMMA_MODE == 2  // GAMMA_2_2
constexpr auto LUT = generate_gamma22_lut();
#else
#error "Invalid LEDMATRIX_GAMMA_MODE (must be 0=LINEAR, 1=CIE1931, or 2=GAMMA_2_2)"
#endif

const uint8_t *get_lut() noexcept { return LUT.data(); }

// ============================================================================
// Compile-Time Validation
// ============================================================================

namespace {

// Gamma curves must be non-decreasing
consteval bool validate_lut_monotonic(const std::array<uint8_t, 256> &lut) {
  for (size_t i = 1; i < 256; ++i) {
    if (lut[i] < lut[i - 1]) {
      return false;
    }
  }
  return true;
}

// Black stays black, full scale stays full scale
consteval bool validate_lut_endpoints(const std::array<uint8_t, 256> &lut) { return (lut[0] == 0) && (lut[255] == 255); }

// Every curve is checked, not only the selected one
static_assert(validate_lut_monotonic(LUT), "LUT not monotonically increasing");
static_assert(validate_lut_endpoints(LUT), "LUT endpoints incorrect (should be 0 and 255)");
static_assert(validate_lut_monotonic(generate_cie1931_lut()), "CIE1931 LUT not monotonic");
static_assert(validate_lut_endpoints(generate_cie1931_lut()), "CIE1931 LUT endpoints incorrect");
static_assert(validate_lut_monotonic(generate_gamma22_lut()), "Gamma 2.2 LUT not monotonic");
static_assert(validate_lut_endpoints(generate_gamma22_lut()), "Gamma 2.2 LUT endpoints incorrect");

}  // namespace

}  // namespace ledmatrix
