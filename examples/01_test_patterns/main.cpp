// SPDX-FileCopyrightText: 2025 Stuart Parmenter
// SPDX-License-Identifier: MIT

// @file main.cpp
// @brief Wiring check without the serial link
//
// This example demonstrates:
// - Driving the matrix chip directly through MatrixDriver
// - Red, green and blue gradients (brightest at row 1, column 1)
// - Solid colors to spot dead channels
//
// Every frame is pushed with display_full(), so only the last row stays
// lit between updates. Use it to confirm pin mapping and channel order.

#include "board_config.h"
#include "drivers/matrix_driver.h"
#include "frame/frame_buffer.h"
#include "platforms/esp/esp_gpio_bus.h"
#include <esp_log.h>
#include <esp_timer.h>
#include <freertos/FreeRTOS.h>  // NOLINT(misc-header-include-cycle)
#include <freertos/task.h>

using namespace ledmatrix;

static const char *const TAG = "test_patterns";

struct Pattern {
  const char *name;
  FrameBuffer frame;
};

// Redraw the pattern for one second
static void show_for_one_second(MatrixDriver &driver, const Pattern &pattern) {
  ESP_LOGI(TAG, "Pattern: %s", pattern.name);
  const int64_t end = esp_timer_get_time() + 1000000;
  while (esp_timer_get_time() < end) {
    driver.display_full(pattern.frame);
    vTaskDelay(1);
  }
}

extern "C" void app_main() {
  ESP_LOGI(TAG, "LED Matrix Test Patterns Starting...");

  MatrixConfig config = getMenuConfigSettings();
  printPinConfig(config);

  static EspGpioBus bus(config.pins);
  esp_err_t err = bus.init();
  if (err != ESP_OK) {
    ESP_LOGE(TAG, "GPIO setup failed: %s", esp_err_to_name(err));
    return;
  }

  static MatrixDriver driver(bus);
  ESP_LOGI(TAG, "Matrix chip initialized");

  static const Pattern patterns[] = {
      {"Red gradient", FrameBuffer::gradient(Color::RED)},
      {"Green gradient", FrameBuffer::gradient(Color::GREEN)},
      {"Blue gradient", FrameBuffer::gradient(Color::BLUE)},
      {"Solid red", FrameBuffer::solid(Color::RED)},
      {"Solid green", FrameBuffer::solid(Color::GREEN)},
      {"Solid blue", FrameBuffer::solid(Color::BLUE)},
      {"Solid white (dimmed)", FrameBuffer::solid(Color::WHITE / 4.0f)},
  };

  while (true) {
    for (const Pattern &pattern : patterns) {
      show_for_one_second(driver, pattern);
    }
  }
}
