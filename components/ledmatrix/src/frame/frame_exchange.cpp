// SPDX-FileCopyrightText: 2025 Stuart Parmenter
// SPDX-License-Identifier: MIT

// @file frame_exchange.cpp
// @brief Pending frame handoff implementation

#include "frame_exchange.h"

namespace ledmatrix {

FrameExchange::FrameExchange(BufferPool &pool, CriticalSection &lock) : pool_(pool), lock_(lock) {}

FrameBuffer *FrameExchange::acquire() {
  CriticalSectionGuard guard(lock_);
  return pool_.allocate();
}

LEDMATRIX_IRAM FrameBuffer *FrameExchange::publish(FrameBuffer *completed) {
  CriticalSectionGuard guard(lock_);
  if (pending_ != nullptr) {
    // Superseded before it was ever shown
    pool_.free(pending_);
  }
  pending_ = completed;
  return pool_.allocate();
}

LEDMATRIX_IRAM FrameBuffer *FrameExchange::take_pending(FrameBuffer *current) {
  CriticalSectionGuard guard(lock_);
  if (pending_ == nullptr) {
    return current;
  }
  FrameBuffer *next = pending_;
  pending_ = nullptr;
  pool_.free(current);
  return next;
}

bool FrameExchange::has_pending() const {
  CriticalSectionGuard guard(lock_);
  return pending_ != nullptr;
}

}  // namespace ledmatrix
