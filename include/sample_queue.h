// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file sample_queue.h
 * @brief Mailbox between the acquisition thread and the render tick
 *
 * One producer (AcquisitionLoop) calls put(); one consumer (the LVGL render
 * tick) calls drain_all() once per frame. Neither side ever waits for the
 * other beyond the internal lock.
 */

#include "telemetry_sample.h"

#include <deque>
#include <mutex>
#include <vector>

namespace rocketscope {

class SampleQueue {
  public:
    SampleQueue() = default;

    SampleQueue(const SampleQueue&) = delete;
    SampleQueue& operator=(const SampleQueue&) = delete;

    /// Enqueue a sample (thread-safe, never blocks on the consumer)
    void put(TelemetrySample sample);

    /**
     * @brief Remove and return everything queued, oldest first
     *
     * Returns an empty vector immediately when nothing is queued.
     */
    std::vector<TelemetrySample> drain_all();

    /// Drop everything queued (used when switching sources)
    void clear();

    size_t size() const;
    bool empty() const;

  private:
    mutable std::mutex mutex_;
    std::deque<TelemetrySample> samples_;
};

} // namespace rocketscope
