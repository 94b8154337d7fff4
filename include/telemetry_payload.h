// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file telemetry_payload.h
 * @brief Wire format shared by the serial and TCP sources
 *
 * Senders emit one JSON object per line:
 * @code
 * {"flight_time": 12.3, "altitude": 512.4, "velocity": 88.2, "phase": "Powered Ascent"}
 * @endcode
 *
 * Parsing is lenient: unknown keys are ignored, keys with the wrong value type
 * are skipped individually, and numeric values may also arrive as strings.
 * A line that is not a JSON object or carries none of the recognized keys is
 * rejected.
 */

#include "telemetry_sample.h"

#include <cstddef>
#include <deque>
#include <optional>
#include <string>

namespace rocketscope {

/**
 * @brief Parse one telemetry record
 *
 * @param line  Record text without the trailing newline
 * @param error Receives a short reason when the record is rejected (optional)
 * @return Sample, or nullopt for malformed/empty records
 */
std::optional<TelemetrySample> parse_telemetry_payload(const std::string& line,
                                                       std::string* error = nullptr);

/**
 * @brief Splits a byte stream into newline-terminated records
 *
 * Bytes arrive in arbitrary chunks from read()/recv(). Complete lines are
 * queued (CR stripped, blank lines dropped); the trailing partial line is kept
 * until its newline arrives. A partial line that grows past max_line_length is
 * discarded to bound memory when a sender never terminates its records.
 */
class LineAssembler {
  public:
    static constexpr size_t DEFAULT_MAX_LINE_LENGTH = 64 * 1024;

    explicit LineAssembler(size_t max_line_length = DEFAULT_MAX_LINE_LENGTH);

    /// Append received bytes
    void feed(const char* data, size_t size);

    /// Pop the oldest complete line
    std::optional<std::string> next_line();

    /// Number of complete lines waiting
    size_t pending_lines() const {
        return lines_.size();
    }

    /// Number of lines discarded for exceeding the length limit
    size_t overflow_count() const {
        return overflow_count_;
    }

    void clear();

  private:
    size_t max_line_length_;
    std::string partial_;
    std::deque<std::string> lines_;
    size_t overflow_count_ = 0;
    bool discarding_ = false;
};

} // namespace rocketscope
