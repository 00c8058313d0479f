/**
 * SPDX-FileCopyrightText: 2025 Stuart Parmenter
 * SPDX-License-Identifier: MIT
 *
 * @file ledmatrix_internal.h
 * @brief Internal hooks used within the controller implementation
 *
 * These are not part of the public API and should not be used
 * by external code.
 */

#pragma once

namespace ledmatrix {

/**
 * @brief Report a broken invariant and stop
 *
 * Called for conditions the frame protocol rules out by construction
 * (pool exhaustion, out-of-range pixel addressing). Never returns.
 * The implementation is provided by the platform port.
 */
[[noreturn]] void invariant_violation(const char *what);

}  // namespace ledmatrix
