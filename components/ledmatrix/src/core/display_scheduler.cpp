// SPDX-FileCopyrightText: 2025 Stuart Parmenter
// SPDX-License-Identifier: MIT

// @file display_scheduler.cpp
// @brief Row scheduler implementation

#include "display_scheduler.h"

namespace ledmatrix {

DisplayScheduler::DisplayScheduler(FrameExchange &exchange, MatrixDriver &driver)
    : exchange_(exchange), driver_(driver), current_(exchange.acquire()) {
  *current_ = FrameBuffer();
}

LEDMATRIX_IRAM Instant DisplayScheduler::tick(Instant deadline) {
  if (next_row_ == 1) {
    current_ = exchange_.take_pending(current_);
  }

  driver_.send_row(next_row_, current_->row(next_row_));

  next_row_ = (next_row_ == MATRIX_SIZE) ? 1 : next_row_ + 1;

  return deadline + ROW_PERIOD;
}

}  // namespace ledmatrix
