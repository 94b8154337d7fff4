// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file history_buffer.h
 * @brief Fixed-capacity chart history, one ring per metric plus a time ring
 *
 * All rings advance together: every append() adds exactly one entry to the
 * time ring and to each metric ring, so index i refers to the same sample in
 * all of them. Metrics a sample did not carry are stored as NaN gaps (never
 * as zero); the chart renderer skips them.
 *
 * Thread safety: render (LVGL) thread only.
 */

#include "telemetry_sample.h"

#include <array>
#include <cstddef>
#include <optional>
#include <vector>

namespace rocketscope {

/// Fixed-size FIFO of doubles; the oldest entry is overwritten when full
class RingBuffer {
  public:
    explicit RingBuffer(size_t capacity);

    void push(double value);
    void clear();

    /// i = 0 is the oldest retained entry
    double at(size_t i) const;

    size_t size() const {
        return size_;
    }
    size_t capacity() const {
        return data_.size();
    }

    /// Oldest-to-newest copy
    std::vector<double> to_vector() const;

  private:
    std::vector<double> data_;
    size_t head_ = 0; ///< Index of the oldest entry
    size_t size_ = 0;
};

class HistoryBuffer {
  public:
    static constexpr size_t DEFAULT_CAPACITY = 500;

    /// @param capacity Entries retained per ring (0 is treated as 1)
    explicit HistoryBuffer(size_t capacity = DEFAULT_CAPACITY);

    /**
     * @brief Record a sample
     *
     * The time coordinate is the sample's flight_time, or fallback_time when
     * the sender omitted it.
     *
     * @return false (nothing recorded) if the sample has neither a metric
     *         nor a flight time
     */
    bool append(const TelemetrySample& sample, double fallback_time);

    void clear();

    size_t size() const {
        return time_.size();
    }
    size_t capacity() const {
        return time_.capacity();
    }
    bool empty() const {
        return time_.size() == 0;
    }

    /// Time coordinates, oldest first
    std::vector<double> times() const;

    /// Metric values aligned with times(); NaN where the sample lacked the metric
    std::vector<double> values(Metric metric) const;

    /// nullopt for a gap
    std::optional<double> value_at(Metric metric, size_t i) const;

  private:
    RingBuffer time_;
    std::array<RingBuffer, METRIC_COUNT> metrics_;
};

} // namespace rocketscope
