// SPDX-FileCopyrightText: 2025 Stuart Parmenter
// SPDX-License-Identifier: MIT

// @file ledmatrix_types.h
// @brief Common types for the 8x8 LED matrix controller

#pragma once

#include "ledmatrix_config.h"
#include <stdint.h>

/**
 * @brief Pin configuration for the matrix driver chip
 *
 * GPIO numbers, -1 if unassigned.
 */
struct MatrixPins {
  // Serial data path into the shift registers
  int8_t sck = -1;  // Shift clock
  int8_t sda = -1;  // Serial data

  // Control signals
  int8_t lat = -1;  // Latch (pulsed low to commit)
  int8_t sb = -1;   // Bank select / blank (low while writing bank 0)
  int8_t rst = -1;  // Chip reset (active low)

  // Row select lines, rows 1..8
  int8_t rows[8] = {-1, -1, -1, -1, -1, -1, -1, -1};
};

/**
 * @brief Serial link configuration
 */
struct MatrixUartConfig {
  int port = 1;
  int8_t rx_pin = -1;
  int8_t tx_pin = -1;  // Unused by the protocol, -1 to leave unrouted
  uint32_t baud_rate = LEDMATRIX_UART_BAUD;
  uint16_t rx_buffer_size = LEDMATRIX_UART_RX_BUFFER;
};

/**
 * @brief Controller configuration
 */
struct MatrixConfig {
  // ========================================
  // Hardware
  // ========================================

  MatrixPins pins{};
  MatrixUartConfig uart{};

  // ========================================
  // Receiver task
  // ========================================

  // 0 selects the highest FreeRTOS priority (configMAX_PRIORITIES - 1)
  uint8_t rx_task_priority = 0;
  uint32_t rx_task_stack = 3072;
  int8_t rx_task_core = -1;  // -1 = no affinity
};
