// SPDX-FileCopyrightText: 2025 Stuart Parmenter
// SPDX-License-Identifier: MIT
//
// @file ledmatrix_controller.cpp
// @brief Pipeline wiring: GPIO bus, buffer pool, decoder, scheduler, UART

#include "ledmatrix.h"
#include "display_scheduler.h"
#include "../drivers/matrix_driver.h"
#include "../frame/buffer_pool.h"
#include "../frame/frame_exchange.h"
#include "../protocol/frame_decoder.h"
#include "../platforms/esp/esp_gpio_bus.h"
#include "../platforms/esp/port_mux_section.h"
#include "../platforms/esp/row_timer.h"
#include "../platforms/esp/uart_receiver.h"

#include <esp_log.h>
#include <sdkconfig.h>
#include <freertos/FreeRTOS.h>  // NOLINT(misc-header-include-cycle)
#include <optional>

static const char *const TAG = "LEDMATRIX";

using namespace ledmatrix;

// Everything the running pipeline owns. The decoder and scheduler each take
// one pool buffer on construction; the third is the pending-frame slot.
struct LedMatrixController::Pipeline {
  explicit Pipeline(const MatrixConfig &config)
      : bus(config.pins), exchange(pool, lock), decoder(exchange), receiver(config.uart, decoder) {}

  EspGpioBus bus;
  PortMuxSection lock;
  BufferPool pool;
  FrameExchange exchange;
  FrameDecoder decoder;
  UartReceiver receiver;

  // Constructed only once the GPIOs are configured
  std::optional<MatrixDriver> driver;
  std::optional<DisplayScheduler> scheduler;
  std::optional<RowTimer> timer;
};

// ============================================================================
// Constructor / Destructor
// ============================================================================

LedMatrixController::LedMatrixController(const MatrixConfig &config) : config_(config), running_(false) {
  ESP_LOGI(TAG, "Controller created for %s", CONFIG_IDF_TARGET);
  ESP_LOGI(TAG, "Matrix: %ux%u, %u-buffer pool, %d Hz refresh", (unsigned) MATRIX_SIZE, (unsigned) MATRIX_SIZE,
           (unsigned) BufferPool::CAPACITY, LEDMATRIX_TARGET_FPS);
  ESP_LOGI(TAG, "Config: gamma mode %d, UART%d @ %lu baud", LEDMATRIX_GAMMA_MODE, config_.uart.port,
           (unsigned long) config_.uart.baud_rate);
}

LedMatrixController::~LedMatrixController() = default;

// ============================================================================
// Initialization
// ============================================================================

bool LedMatrixController::begin() {
  if (running_) {
    ESP_LOGW(TAG, "Already running");
    return true;
  }

  ESP_LOGI(TAG, "Initializing LED matrix controller...");

  if (config_.uart.rx_pin < 0) {
    ESP_LOGE(TAG, "No UART RX pin configured");
    return false;
  }

  pipeline_ = std::make_unique<Pipeline>(config_);
  Pipeline &p = *pipeline_;

  esp_err_t err = p.bus.init();
  if (err != ESP_OK) {
    ESP_LOGE(TAG, "GPIO setup failed: %s", esp_err_to_name(err));
    pipeline_.reset();
    return false;
  }

  // Blocks ~100 ms for reset, then arms bank 0
  p.driver.emplace(p.bus);
  ESP_LOGI(TAG, "Matrix chip reset, bank 0 initialized");

  p.scheduler.emplace(p.exchange, *p.driver);

  // Receiver first: until the row timer runs, any failure below can tear
  // the whole pipeline down without racing a tick
  const UBaseType_t priority =
      config_.rx_task_priority != 0 ? config_.rx_task_priority : (UBaseType_t) (configMAX_PRIORITIES - 1);
  err = p.receiver.start(priority, config_.rx_task_stack, config_.rx_task_core);
  if (err != ESP_OK) {
    ESP_LOGE(TAG, "Serial receiver failed to start: %s", esp_err_to_name(err));
    pipeline_.reset();
    return false;
  }

  p.timer.emplace(*p.scheduler);
  err = p.timer->start();
  if (err != ESP_OK) {
    ESP_LOGE(TAG, "Row timer failed to start: %s", esp_err_to_name(err));
    pipeline_.reset();
    return false;
  }

  running_ = true;
  ESP_LOGI(TAG, "Controller started successfully");
  return true;
}

// ============================================================================
// Information
// ============================================================================

bool LedMatrixController::is_running() const { return running_; }

uint32_t LedMatrixController::frames_received() const {
  return pipeline_ ? pipeline_->decoder.frames_completed() : 0;
}
