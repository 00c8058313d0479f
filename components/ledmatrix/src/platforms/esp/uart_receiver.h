// SPDX-FileCopyrightText: 2025 Stuart Parmenter
// SPDX-License-Identifier: MIT

// @file uart_receiver.h
// @brief Serial link feeding the frame decoder

#pragma once

#include "../../protocol/frame_decoder.h"
#include "ledmatrix_types.h"
#include <esp_err.h>
#include <driver/uart.h>
#include <freertos/FreeRTOS.h>  // NOLINT(misc-header-include-cycle)
#include <freertos/task.h>

namespace ledmatrix {

/**
 * @brief Highest-priority task draining the UART into a FrameDecoder
 *
 * Runs above the esp_timer task that drives the row scheduler, so byte
 * handling preempts row emission.
 */
class UartReceiver {
 public:
  UartReceiver(const MatrixUartConfig &config, FrameDecoder &decoder);

  /**
   * @brief Stop the receive task and uninstall the UART driver
   */
  ~UartReceiver();

  UartReceiver(const UartReceiver &) = delete;
  UartReceiver &operator=(const UartReceiver &) = delete;

  /**
   * @brief Install the UART driver and start the receive task
   *
   * On failure nothing stays installed, so start() may be retried.
   */
  esp_err_t start(UBaseType_t priority, uint32_t stack_size, int8_t core);

 private:
  static void task_entry(void *arg);
  [[noreturn]] void run();
  void release();

  MatrixUartConfig config_;
  FrameDecoder &decoder_;
  TaskHandle_t task_ = nullptr;
  bool installed_ = false;
};

}  // namespace ledmatrix
