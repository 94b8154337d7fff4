// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "sample_queue.h"

#include <iterator>

namespace rocketscope {

void SampleQueue::put(TelemetrySample sample) {
    std::lock_guard<std::mutex> lock(mutex_);
    samples_.push_back(std::move(sample));
}

std::vector<TelemetrySample> SampleQueue::drain_all() {
    std::deque<TelemetrySample> taken;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (samples_.empty()) {
            return {};
        }
        taken.swap(samples_);
    }

    return std::vector<TelemetrySample>(std::make_move_iterator(taken.begin()),
                                        std::make_move_iterator(taken.end()));
}

void SampleQueue::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    samples_.clear();
}

size_t SampleQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return samples_.size();
}

bool SampleQueue::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return samples_.empty();
}

} // namespace rocketscope
