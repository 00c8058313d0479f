// SPDX-FileCopyrightText: 2025 Stuart Parmenter
// SPDX-License-Identifier: MIT

// @file board_config.h
// @brief Helper to load menuconfig settings into MatrixConfig

#pragma once

#include "ledmatrix.h"
#include "sdkconfig.h"
#include <esp_log.h>
#include <cstdio>

static const char *const TAG_CONFIG = "board_config";

// Load configuration from menuconfig (CONFIG_* defines)
static inline MatrixConfig getMenuConfigSettings() {
  MatrixConfig config = {};

  // Pin configuration (board preset or custom)
#if defined(CONFIG_LEDMATRIX_BOARD_ESP32S3_DEVKIT)
  // ESP32-S3 DevKitC-1, matrix shield on the left header
  config.pins.sck = 12;
  config.pins.sda = 11;
  config.pins.lat = 10;
  config.pins.sb = 9;
  config.pins.rst = 46;
  config.pins.rows[0] = 4;
  config.pins.rows[1] = 5;
  config.pins.rows[2] = 6;
  config.pins.rows[3] = 7;
  config.pins.rows[4] = 15;
  config.pins.rows[5] = 16;
  config.pins.rows[6] = 17;
  config.pins.rows[7] = 18;
  config.uart.rx_pin = 44;
  config.uart.tx_pin = 43;
  ESP_LOGI(TAG_CONFIG, "Board preset: ESP32-S3 DevKitC-1");

#elif defined(CONFIG_LEDMATRIX_BOARD_CUSTOM)
  // Custom pin configuration from menuconfig
  config.pins.sck = CONFIG_LEDMATRIX_PIN_SCK;
  config.pins.sda = CONFIG_LEDMATRIX_PIN_SDA;
  config.pins.lat = CONFIG_LEDMATRIX_PIN_LAT;
  config.pins.sb = CONFIG_LEDMATRIX_PIN_SB;
  config.pins.rst = CONFIG_LEDMATRIX_PIN_RST;
  config.pins.rows[0] = CONFIG_LEDMATRIX_PIN_C0;
  config.pins.rows[1] = CONFIG_LEDMATRIX_PIN_C1;
  config.pins.rows[2] = CONFIG_LEDMATRIX_PIN_C2;
  config.pins.rows[3] = CONFIG_LEDMATRIX_PIN_C3;
  config.pins.rows[4] = CONFIG_LEDMATRIX_PIN_C4;
  config.pins.rows[5] = CONFIG_LEDMATRIX_PIN_C5;
  config.pins.rows[6] = CONFIG_LEDMATRIX_PIN_C6;
  config.pins.rows[7] = CONFIG_LEDMATRIX_PIN_C7;
  config.uart.rx_pin = CONFIG_LEDMATRIX_UART_RX_PIN;
  config.uart.tx_pin = CONFIG_LEDMATRIX_UART_TX_PIN;
  ESP_LOGI(TAG_CONFIG, "Board preset: Custom");

#else  // ESP32 DevKitC (default)
  // GPIO 6-11 are wired to flash and 34-39 are input-only, so neither is used
  config.pins.sck = 18;
  config.pins.sda = 23;
  config.pins.lat = 5;
  config.pins.sb = 19;
  config.pins.rst = 4;
  config.pins.rows[0] = 13;
  config.pins.rows[1] = 12;
  config.pins.rows[2] = 14;
  config.pins.rows[3] = 27;
  config.pins.rows[4] = 26;
  config.pins.rows[5] = 25;
  config.pins.rows[6] = 33;
  config.pins.rows[7] = 32;
  config.uart.rx_pin = 16;
  config.uart.tx_pin = 17;
  ESP_LOGI(TAG_CONFIG, "Board preset: ESP32 DevKitC");
#endif

  // Serial link
#ifdef CONFIG_LEDMATRIX_UART_PORT
  config.uart.port = CONFIG_LEDMATRIX_UART_PORT;
#endif
  config.uart.baud_rate = LEDMATRIX_UART_BAUD;

  // Receiver task (0 = highest priority)
#ifdef CONFIG_LEDMATRIX_RX_TASK_PRIORITY
  config.rx_task_priority = CONFIG_LEDMATRIX_RX_TASK_PRIORITY;
#endif
#ifdef CONFIG_LEDMATRIX_RX_TASK_CORE
  config.rx_task_core = CONFIG_LEDMATRIX_RX_TASK_CORE;
#endif

  // Refresh rate & gamma: Configure via menuconfig
  // (idf.py menuconfig → LED Matrix → Display)
  // Or CMake override: -DLEDMATRIX_TARGET_FPS=50 -DLEDMATRIX_GAMMA_MODE=2

  return config;
}

// Helper: Print pin configuration (for debugging)
static inline void printPinConfig(const MatrixConfig &config) {
  const MatrixPins &pins = config.pins;
  printf("LED Matrix Pin Configuration:\n");
  printf("  Shift: SCK=%d, SDA=%d\n", pins.sck, pins.sda);
  printf("  Control: LAT=%d, SB=%d, RST=%d\n", pins.lat, pins.sb, pins.rst);
  printf("  Rows: C0=%d, C1=%d, C2=%d, C3=%d, C4=%d, C5=%d, C6=%d, C7=%d\n", pins.rows[0], pins.rows[1],
         pins.rows[2], pins.rows[3], pins.rows[4], pins.rows[5], pins.rows[6], pins.rows[7]);
  printf("  UART%d: RX=%d, TX=%d, %lu baud\n", config.uart.port, config.uart.rx_pin, config.uart.tx_pin,
         (unsigned long) config.uart.baud_rate);
}
