// SPDX-FileCopyrightText: 2025 Stuart Parmenter
// SPDX-License-Identifier: MIT

// @file ledmatrix_main.cpp
// @brief Firmware entry point: serial-fed 8x8 LED matrix
//
// Frames arrive on the configured UART (64 RGB pixels, 0xFF resync) and are
// displayed at the configured refresh rate. Until the first frame arrives
// the matrix stays dark.

#include "ledmatrix.h"
#include "board_config.h"
#include <esp_log.h>
#include <freertos/FreeRTOS.h>  // NOLINT(misc-header-include-cycle)
#include <freertos/task.h>

static const char *const TAG = "ledmatrix_main";

extern "C" void app_main() {
  ESP_LOGI(TAG, "LED Matrix Controller Starting...");
  ESP_LOGI(TAG, "Loading configuration from menuconfig...");

  MatrixConfig config = getMenuConfigSettings();
  printPinConfig(config);

  // Lives for the rest of the program
  static LedMatrixController controller(config);

  if (!controller.begin()) {
    ESP_LOGE(TAG, "Failed to initialize LED matrix controller!");
    return;
  }

  ESP_LOGI(TAG, "Waiting for frames...");

  // Idle loop (refresh and reception run on their own)
  uint32_t last_frames = 0;
  while (true) {
    vTaskDelay(pdMS_TO_TICKS(5000));
    const uint32_t frames = controller.frames_received();
    ESP_LOGI(TAG, "Frames received: %lu (+%lu)", (unsigned long) frames, (unsigned long) (frames - last_frames));
    last_frames = frames;
  }
}
