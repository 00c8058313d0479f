// SPDX-FileCopyrightText: 2025 Stuart Parmenter
// SPDX-License-Identifier: MIT

// @file esp_panic.cpp
// @brief Invariant violation handler for ESP-IDF targets

#include "ledmatrix_internal.h"
#include <esp_system.h>

namespace ledmatrix {

// Safe from any context: prints the reason on the panic console and resets
void invariant_violation(const char *what) { esp_system_abort(what); }

}  // namespace ledmatrix
