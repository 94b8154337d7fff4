// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace rocketscope::fmt {

/**
 * @brief Current local wall-clock time with millisecond resolution
 *
 * Produces output like "14:03:27.512". Used for sample timestamps and for log
 * lines whose sample carried no timestamp.
 *
 * @return Formatted string
 */
std::string wall_clock_timestamp();

/**
 * @brief Format a measurement for a data card
 *
 * One decimal place ("512.4"); magnitudes of 1e9 and above use three
 * significant digits ("1e+300"). "--" when the value is absent or not finite.
 *
 * @param value Measurement (nullopt = never received)
 * @return Formatted string
 */
std::string reading(std::optional<double> value);

/**
 * @brief Number of decimals for axis labels spanning the given range
 *
 * - range >= 10: 0 decimals
 * - range >= 1: 1 decimal
 * - otherwise: 2 decimals
 */
int axis_decimals(double range);

/**
 * @brief Format an axis label value with a fixed number of decimals
 *
 * Negative zero is printed as "0".
 *
 * @param value Label value
 * @param decimals Decimal places (clamped to 0..6)
 * @return Formatted string
 */
std::string axis_value(double value, int decimals);

/**
 * @brief Format a value into a caller buffer with one decimal
 *
 * Same output as reading() but allocation free, for the per-tick card updates.
 *
 * @param buf Output buffer
 * @param buf_size Size of output buffer (recommended minimum: 16)
 * @param value Measurement
 * @return Number of characters written (excluding null terminator), or 0 on error.
 *         "--" is written when the formatted value does not fit.
 */
size_t reading_to_buffer(char* buf, size_t buf_size, double value);

} // namespace rocketscope::fmt
