// SPDX-FileCopyrightText: 2025 Stuart Parmenter
// SPDX-License-Identifier: MIT

// @file port_mux_section.h
// @brief CriticalSection backed by a FreeRTOS spinlock

#pragma once

#include "../critical_section.h"
#include <freertos/FreeRTOS.h>  // NOLINT(misc-header-include-cycle)

namespace ledmatrix {

/**
 * @brief portMUX critical section
 *
 * The _SAFE variants pick the ISR or task form at runtime, so the same
 * lock serves the receiver and the row timer callback.
 */
class PortMuxSection : public CriticalSection {
 public:
  void enter() override { portENTER_CRITICAL_SAFE(&mux_); }
  void exit() override { portEXIT_CRITICAL_SAFE(&mux_); }

 private:
  portMUX_TYPE mux_ = portMUX_INITIALIZER_UNLOCKED;
};

}  // namespace ledmatrix
