// SPDX-FileCopyrightText: 2025 Stuart Parmenter
// SPDX-License-Identifier: MIT

// @file uart_receiver.cpp
// @brief UART setup and receive loop

#include "uart_receiver.h"
#include <esp_log.h>

namespace ledmatrix {

static const char *const TAG = "LEDMATRIX_UART";

// Bytes pulled from the driver per read; each is decoded individually
static constexpr size_t READ_CHUNK = 64;

UartReceiver::UartReceiver(const MatrixUartConfig &config, FrameDecoder &decoder)
    : config_(config), decoder_(decoder) {}

UartReceiver::~UartReceiver() { release(); }

void UartReceiver::release() {
  if (task_ != nullptr) {
    vTaskDelete(task_);
    task_ = nullptr;
  }
  if (installed_) {
    esp_err_t err = uart_driver_delete((uart_port_t) config_.port);
    if (err != ESP_OK) {
      ESP_LOGW(TAG, "uart_driver_delete failed: %s", esp_err_to_name(err));
    }
    installed_ = false;
  }
}

esp_err_t UartReceiver::start(UBaseType_t priority, uint32_t stack_size, int8_t core) {
  const uart_port_t port = (uart_port_t) config_.port;

  // Order matters: driver install, then parameters, then pins
  esp_err_t err = uart_driver_install(port, config_.rx_buffer_size, 0, 0, nullptr, 0);
  if (err != ESP_OK) {
    ESP_LOGE(TAG, "uart_driver_install failed: %s", esp_err_to_name(err));
    return err;
  }
  installed_ = true;

  uart_config_t uart_config = {};
  uart_config.baud_rate = (int) config_.baud_rate;
  uart_config.data_bits = UART_DATA_8_BITS;
  uart_config.parity = UART_PARITY_DISABLE;
  uart_config.stop_bits = UART_STOP_BITS_1;
  uart_config.flow_ctrl = UART_HW_FLOWCTRL_DISABLE;
  uart_config.source_clk = UART_SCLK_DEFAULT;

  err = uart_param_config(port, &uart_config);
  if (err != ESP_OK) {
    ESP_LOGE(TAG, "uart_param_config failed: %s", esp_err_to_name(err));
    release();
    return err;
  }

  err = uart_set_pin(port, config_.tx_pin < 0 ? UART_PIN_NO_CHANGE : config_.tx_pin, config_.rx_pin,
                     UART_PIN_NO_CHANGE, UART_PIN_NO_CHANGE);
  if (err != ESP_OK) {
    ESP_LOGE(TAG, "uart_set_pin failed: %s", esp_err_to_name(err));
    release();
    return err;
  }

  const BaseType_t affinity = (core < 0) ? tskNO_AFFINITY : core;
  if (xTaskCreatePinnedToCore(task_entry, "matrix_rx", stack_size, this, priority, &task_, affinity) != pdPASS) {
    ESP_LOGE(TAG, "Failed to create receive task");
    task_ = nullptr;
    release();
    return ESP_ERR_NO_MEM;
  }

  ESP_LOGI(TAG, "UART%d: %lu baud 8N1, RX=%d, task priority %u", config_.port, (unsigned long) config_.baud_rate,
           config_.rx_pin, (unsigned) priority);
  return ESP_OK;
}

void UartReceiver::task_entry(void *arg) { static_cast<UartReceiver *>(arg)->run(); }

void UartReceiver::run() {
  uint8_t chunk[READ_CHUNK];
  while (true) {
    // Wait at most one tick so a partial chunk is decoded promptly
    const int len = uart_read_bytes((uart_port_t) config_.port, chunk, sizeof(chunk), 1);
    for (int i = 0; i < len; i++) {
      decoder_.on_byte(chunk[i]);
    }
  }
}

}  // namespace ledmatrix
