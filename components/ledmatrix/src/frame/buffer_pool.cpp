// SPDX-FileCopyrightText: 2025 Stuart Parmenter
// SPDX-License-Identifier: MIT

// @file buffer_pool.cpp
// @brief Frame buffer pool implementation

#include "buffer_pool.h"
#include "ledmatrix_internal.h"

namespace ledmatrix {

BufferPool::BufferPool() {
  for (FrameBuffer &slot : slots_) {
    free_list_[free_count_++] = &slot;
  }
}

LEDMATRIX_IRAM FrameBuffer *BufferPool::allocate() {
  if (free_count_ == 0) {
    invariant_violation("BufferPool: exhausted");
  }
  return free_list_[--free_count_];
}

LEDMATRIX_IRAM void BufferPool::free(FrameBuffer *buffer) {
  if (!owns(buffer)) {
    invariant_violation("BufferPool: foreign buffer returned");
  }
  if (free_count_ == CAPACITY) {
    invariant_violation("BufferPool: buffer returned twice");
  }
  free_list_[free_count_++] = buffer;
}

bool BufferPool::owns(const FrameBuffer *buffer) const {
  for (const FrameBuffer &slot : slots_) {
    if (&slot == buffer) {
      return true;
    }
  }
  return false;
}

}  // namespace ledmatrix
