// SPDX-FileCopyrightText: 2025 Stuart Parmenter
// SPDX-License-Identifier: MIT

// @file esp_gpio_bus.cpp
// @brief GPIO setup and line control for the matrix driver

#include "esp_gpio_bus.h"
#include "ledmatrix_config.h"
#include <esp_log.h>
#include <freertos/FreeRTOS.h>  // NOLINT(misc-header-include-cycle)
#include <freertos/task.h>

namespace ledmatrix {

static const char *const TAG = "LEDMATRIX_GPIO";

EspGpioBus::EspGpioBus(const MatrixPins &pins)
    : pin_map_{(gpio_num_t) pins.sck,     (gpio_num_t) pins.sda,     (gpio_num_t) pins.lat,
               (gpio_num_t) pins.sb,      (gpio_num_t) pins.rst,     (gpio_num_t) pins.rows[0],
               (gpio_num_t) pins.rows[1], (gpio_num_t) pins.rows[2], (gpio_num_t) pins.rows[3],
               (gpio_num_t) pins.rows[4], (gpio_num_t) pins.rows[5], (gpio_num_t) pins.rows[6],
               (gpio_num_t) pins.rows[7]} {}

esp_err_t EspGpioBus::init() {
  uint64_t mask = 0;
  for (gpio_num_t pin : pin_map_) {
    if (pin < 0) {
      ESP_LOGE(TAG, "Matrix line without a GPIO assignment");
      return ESP_ERR_INVALID_ARG;
    }
    mask |= (1ULL << pin);
  }

  gpio_config_t io_conf = {};
  io_conf.pin_bit_mask = mask;
  io_conf.mode = GPIO_MODE_OUTPUT;
  io_conf.pull_up_en = GPIO_PULLUP_DISABLE;
  io_conf.pull_down_en = GPIO_PULLDOWN_DISABLE;
  io_conf.intr_type = GPIO_INTR_DISABLE;

  esp_err_t err = gpio_config(&io_conf);
  if (err != ESP_OK) {
    ESP_LOGE(TAG, "gpio_config failed: %s", esp_err_to_name(err));
    return err;
  }

  for (gpio_num_t pin : pin_map_) {
    err = gpio_set_drive_capability(pin, GPIO_DRIVE_CAP_3);  // Maximum drive strength
    if (err != ESP_OK) {
      ESP_LOGE(TAG, "gpio_set_drive_capability(%d) failed: %s", (int) pin, esp_err_to_name(err));
      return err;
    }
  }

  ESP_LOGI(TAG, "%u matrix lines configured (max drive)", (unsigned) pin_map_.size());
  return ESP_OK;
}

LEDMATRIX_IRAM void EspGpioBus::set_line(MatrixLine line, bool high) {
  gpio_set_level(pin_map_[static_cast<uint8_t>(line)], high ? 1 : 0);
}

void EspGpioBus::delay_ms(uint32_t ms) { vTaskDelay(pdMS_TO_TICKS(ms)); }

}  // namespace ledmatrix
