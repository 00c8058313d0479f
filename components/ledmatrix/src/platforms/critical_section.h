// SPDX-FileCopyrightText: 2025 Stuart Parmenter
// SPDX-License-Identifier: MIT
//
// @file critical_section.h
// @brief Platform-agnostic critical section interface
//
// The byte decoder preempts the row scheduler at any point. Both touch the
// pending frame slot and the buffer pool, so every such access runs inside
// a critical section provided by the platform.

#pragma once

namespace ledmatrix {

/**
 * @brief Short, non-blocking mutual exclusion
 *
 * Implementations must be usable from the highest-priority context and must
 * only ever guard pointer swaps (no I/O, no allocation, no waiting).
 */
class CriticalSection {
 public:
  virtual ~CriticalSection() = default;

  virtual void enter() = 0;
  virtual void exit() = 0;
};

/**
 * @brief RAII scope for a CriticalSection
 */
class CriticalSectionGuard {
 public:
  explicit CriticalSectionGuard(CriticalSection &section) : section_(section) { section_.enter(); }
  ~CriticalSectionGuard() { section_.exit(); }

  CriticalSectionGuard(const CriticalSectionGuard &) = delete;
  CriticalSectionGuard &operator=(const CriticalSectionGuard &) = delete;

 private:
  CriticalSection &section_;
};

}  // namespace ledmatrix
