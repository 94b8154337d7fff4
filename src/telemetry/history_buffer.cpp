// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "history_buffer.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace rocketscope {

namespace {

constexpr double GAP = std::numeric_limits<double>::quiet_NaN();

size_t at_least_one(size_t capacity) {
    return std::max<size_t>(capacity, 1);
}

} // namespace

// ============================================================================
// RingBuffer
// ============================================================================

RingBuffer::RingBuffer(size_t capacity) : data_(at_least_one(capacity), 0.0) {}

void RingBuffer::push(double value) {
    if (size_ < data_.size()) {
        data_[(head_ + size_) % data_.size()] = value;
        size_++;
    } else {
        // Full: overwrite the oldest and advance
        data_[head_] = value;
        head_ = (head_ + 1) % data_.size();
    }
}

void RingBuffer::clear() {
    head_ = 0;
    size_ = 0;
}

double RingBuffer::at(size_t i) const {
    return data_[(head_ + i) % data_.size()];
}

std::vector<double> RingBuffer::to_vector() const {
    std::vector<double> out;
    out.reserve(size_);
    for (size_t i = 0; i < size_; ++i) {
        out.push_back(at(i));
    }
    return out;
}

// ============================================================================
// HistoryBuffer
// ============================================================================

HistoryBuffer::HistoryBuffer(size_t capacity)
    : time_(capacity),
      metrics_{RingBuffer(capacity), RingBuffer(capacity), RingBuffer(capacity),
               RingBuffer(capacity), RingBuffer(capacity)} {}

bool HistoryBuffer::append(const TelemetrySample& sample, double fallback_time) {
    if (!sample.has_any_metric() && !sample.flight_time) {
        return false;
    }

    time_.push(sample.flight_time ? *sample.flight_time : fallback_time);
    for (Metric m : ALL_METRICS) {
        auto v = sample.get(m);
        metrics_[static_cast<size_t>(m)].push(v ? *v : GAP);
    }
    return true;
}

void HistoryBuffer::clear() {
    time_.clear();
    for (auto& ring : metrics_) {
        ring.clear();
    }
}

std::vector<double> HistoryBuffer::times() const {
    return time_.to_vector();
}

std::vector<double> HistoryBuffer::values(Metric metric) const {
    return metrics_[static_cast<size_t>(metric)].to_vector();
}

std::optional<double> HistoryBuffer::value_at(Metric metric, size_t i) const {
    double v = metrics_[static_cast<size_t>(metric)].at(i);
    if (std::isnan(v)) {
        return std::nullopt;
    }
    return v;
}

} // namespace rocketscope
