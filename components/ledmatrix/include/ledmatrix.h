// SPDX-FileCopyrightText: 2025 Stuart Parmenter
// SPDX-License-Identifier: MIT

// @file ledmatrix.h
// @brief Main public API for the 8x8 RGB LED matrix controller
//
// Receives frames over a serial link (64 RGB pixels, 0xFF resync) and
// refreshes the matrix one row at a time at a fixed rate.

#pragma once

#include "ledmatrix_types.h"
#include "ledmatrix_config.h"
#include <stdint.h>
#include <memory>

/**
 * @brief Owns the whole receive/display pipeline
 *
 * Create once (statically) at startup. Everything is allocated inside
 * begin(); nothing allocates afterwards. There is no stop: once running,
 * the receiver and the row refresh run for the life of the program.
 */
class LedMatrixController {
 public:
  /**
   * @brief Construct a controller
   * @param config Pins, serial link and task settings
   */
  explicit LedMatrixController(const MatrixConfig &config);

  ~LedMatrixController();

  LedMatrixController(const LedMatrixController &) = delete;
  LedMatrixController &operator=(const LedMatrixController &) = delete;

  /**
   * @brief Bring up the chip, then start row refresh and the serial receiver
   * @return true on success, false on error
   */
  bool begin();

  /**
   * @brief Check if refresh and reception are active
   */
  bool is_running() const;

  /**
   * @brief Frames fully received since begin()
   */
  uint32_t frames_received() const;

 private:
  struct Pipeline;

  MatrixConfig config_;
  bool running_;
  std::unique_ptr<Pipeline> pipeline_;
};
