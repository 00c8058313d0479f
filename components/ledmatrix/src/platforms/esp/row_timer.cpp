// SPDX-FileCopyrightText: 2025 Stuart Parmenter
// SPDX-License-Identifier: MIT

// @file row_timer.cpp
// @brief Row timer implementation

#include "row_timer.h"
#include "ledmatrix_config.h"
#include "ledmatrix_internal.h"
#include <esp_log.h>

namespace ledmatrix {

static const char *const TAG = "LEDMATRIX_TIMER";

RowTimer::RowTimer(DisplayScheduler &scheduler) : scheduler_(scheduler) {}

RowTimer::~RowTimer() {
  if (timer_) {
    esp_timer_stop(timer_);
    esp_timer_delete(timer_);
  }
}

esp_err_t RowTimer::start() {
  esp_timer_create_args_t timer_args = {};
  timer_args.callback = timer_callback;
  timer_args.arg = this;
  timer_args.dispatch_method = ESP_TIMER_TASK;
  timer_args.name = "matrix_row";

  esp_err_t err = esp_timer_create(&timer_args, &timer_);
  if (err != ESP_OK) {
    ESP_LOGE(TAG, "esp_timer_create failed: %s", esp_err_to_name(err));
    return err;
  }

  deadline_ = now();
  err = esp_timer_start_once(timer_, 0);
  if (err != ESP_OK) {
    ESP_LOGE(TAG, "esp_timer_start_once failed: %s", esp_err_to_name(err));
    return err;
  }

  ESP_LOGI(TAG, "Row refresh started: %lu Hz rows, %d Hz frames", (unsigned long) ROW_RATE_HZ, LEDMATRIX_TARGET_FPS);
  return ESP_OK;
}

Instant RowTimer::now() { return std::chrono::microseconds(esp_timer_get_time()); }

void RowTimer::timer_callback(void *arg) { static_cast<RowTimer *>(arg)->on_tick(); }

LEDMATRIX_IRAM void RowTimer::on_tick() {
  deadline_ = scheduler_.tick(deadline_);
  arm();
}

LEDMATRIX_IRAM void RowTimer::arm() {
  const auto remaining = std::chrono::ceil<std::chrono::microseconds>(deadline_ - now());
  const uint64_t delay_us = remaining.count() > 0 ? static_cast<uint64_t>(remaining.count()) : 0;
  if (esp_timer_start_once(timer_, delay_us) != ESP_OK) {
    // A one-shot timer is never still armed inside its own callback
    invariant_violation("RowTimer: re-arm failed");
  }
}

}  // namespace ledmatrix
