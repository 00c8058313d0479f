// SPDX-FileCopyrightText: 2025 Stuart Parmenter
// SPDX-License-Identifier: MIT

// @file row_timer.h
// @brief esp_timer driving the display scheduler at absolute deadlines

#pragma once

#include "../../core/display_scheduler.h"
#include <esp_err.h>
#include <esp_timer.h>

namespace ledmatrix {

/**
 * @brief One-shot esp_timer re-armed after every tick
 *
 * Each tick is armed for the deadline returned by the previous one, so the
 * row rate stays exact even when a tick runs late.
 */
class RowTimer {
 public:
  explicit RowTimer(DisplayScheduler &scheduler);
  ~RowTimer();

  RowTimer(const RowTimer &) = delete;
  RowTimer &operator=(const RowTimer &) = delete;

  /**
   * @brief Create the timer and fire the first tick immediately
   */
  esp_err_t start();

 private:
  static void timer_callback(void *arg);
  void on_tick();
  void arm();

  static Instant now();

  DisplayScheduler &scheduler_;
  esp_timer_handle_t timer_ = nullptr;
  Instant deadline_{};
};

}  // namespace ledmatrix
