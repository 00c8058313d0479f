// SPDX-FileCopyrightText: 2025 Stuart Parmenter
// SPDX-License-Identifier: MIT

// @file ledmatrix_config.h
// @brief Compile-time configuration for the 8x8 LED matrix controller

#pragma once

/**
 * IRAM optimization
 * Place hot-path code (byte decoder, row emission) in instruction RAM to
 * prevent flash cache stalls. Expands to nothing off-target.
 */
#ifdef ESP_PLATFORM
#include "esp_attr.h"
#define LEDMATRIX_IRAM IRAM_ATTR
#else
#define LEDMATRIX_IRAM
#endif

/**
 * Compiler optimization attributes
 */
#define LEDMATRIX_CONST __attribute__((const))  // Pure math, no memory access
#define LEDMATRIX_WARN_UNUSED __attribute__((warn_unused_result))

/**
 * Full-frame refresh rate in Hz
 * One row is emitted per tick, so the row rate is 8 * LEDMATRIX_TARGET_FPS.
 * Set via menuconfig or override: -DLEDMATRIX_TARGET_FPS=50
 */
#ifndef LEDMATRIX_TARGET_FPS
#ifdef CONFIG_LEDMATRIX_TARGET_FPS
#define LEDMATRIX_TARGET_FPS CONFIG_LEDMATRIX_TARGET_FPS
#else
#define LEDMATRIX_TARGET_FPS 60
#endif
#endif

/**
 * Gamma mode (0=LINEAR/NONE, 1=CIE1931, 2=GAMMA_2_2)
 * Set via menuconfig or override: -DLEDMATRIX_GAMMA_MODE=2
 */
#ifndef LEDMATRIX_GAMMA_MODE
#ifdef CONFIG_LEDMATRIX_GAMMA_MODE
#define LEDMATRIX_GAMMA_MODE CONFIG_LEDMATRIX_GAMMA_MODE
#else
#define LEDMATRIX_GAMMA_MODE 1  // Default: CIE1931
#endif
#endif

/**
 * Serial link defaults (8N1, no flow control)
 */
#ifndef LEDMATRIX_UART_BAUD
#ifdef CONFIG_LEDMATRIX_UART_BAUD
#define LEDMATRIX_UART_BAUD CONFIG_LEDMATRIX_UART_BAUD
#else
#define LEDMATRIX_UART_BAUD 38400
#endif
#endif

#ifndef LEDMATRIX_UART_RX_BUFFER
#define LEDMATRIX_UART_RX_BUFFER 1024
#endif
