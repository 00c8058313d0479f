// SPDX-FileCopyrightText: 2025 Stuart Parmenter
// SPDX-License-Identifier: MIT

// @file esp_gpio_bus.h
// @brief MatrixBus on ESP-IDF GPIOs

#pragma once

#include "../../drivers/matrix_bus.h"
#include "ledmatrix_types.h"
#include <esp_err.h>
#include <driver/gpio.h>
#include <array>

namespace ledmatrix {

class EspGpioBus : public MatrixBus {
 public:
  explicit EspGpioBus(const MatrixPins &pins);

  /**
   * @brief Configure every matrix line as a max-drive push-pull output
   * @return ESP_ERR_INVALID_ARG if a line has no pin assigned
   */
  esp_err_t init();

  void set_line(MatrixLine line, bool high) override;
  void delay_ms(uint32_t ms) override;

 private:
  std::array<gpio_num_t, MATRIX_LINE_COUNT> pin_map_;
};

}  // namespace ledmatrix
