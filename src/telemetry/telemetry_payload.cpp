// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "telemetry_payload.h"

#include <spdlog/spdlog.h>

#include <cmath>
#include <cstdlib>

#include "hv/json.hpp"

using json = nlohmann::json;

namespace rocketscope {

namespace {

std::optional<double> numeric_value(const json& value) {
    if (value.is_number()) {
        double d = value.get<double>();
        if (std::isfinite(d)) {
            return d;
        }
        return std::nullopt;
    }
    if (value.is_string()) {
        const std::string& s = value.get_ref<const std::string&>();
        if (s.empty()) {
            return std::nullopt;
        }
        char* end = nullptr;
        double d = std::strtod(s.c_str(), &end);
        if (end == s.c_str() || *end != '\0' || !std::isfinite(d)) {
            return std::nullopt;
        }
        return d;
    }
    return std::nullopt;
}

void set_error(std::string* error, const std::string& reason) {
    if (error) {
        *error = reason;
    }
}

} // namespace

std::optional<TelemetrySample> parse_telemetry_payload(const std::string& line,
                                                       std::string* error) {
    json doc;
    try {
        doc = json::parse(line);
    } catch (const json::parse_error& e) {
        set_error(error, e.what());
        return std::nullopt;
    }

    if (!doc.is_object()) {
        set_error(error, "payload is not a JSON object");
        return std::nullopt;
    }

    TelemetrySample sample;
    bool recognized = false;

    for (Metric m : ALL_METRICS) {
        auto it = doc.find(metric_key(m));
        if (it == doc.end()) {
            continue;
        }
        if (auto v = numeric_value(*it)) {
            sample.set(m, *v);
            recognized = true;
        } else {
            spdlog::debug("[TelemetryPayload] Ignoring non-numeric '{}'", metric_key(m));
        }
    }

    auto ft = doc.find("flight_time");
    if (ft != doc.end()) {
        if (auto v = numeric_value(*ft)) {
            sample.flight_time = *v;
            recognized = true;
        }
    }

    auto phase = doc.find("phase");
    if (phase != doc.end() && phase->is_string()) {
        sample.phase = phase->get<std::string>();
        recognized = true;
    }

    auto ts = doc.find("timestamp");
    if (ts != doc.end() && ts->is_string()) {
        sample.timestamp = ts->get<std::string>();
        recognized = true;
    }

    if (!recognized) {
        set_error(error, "no recognized telemetry keys");
        return std::nullopt;
    }
    return sample;
}

// ============================================================================
// LineAssembler
// ============================================================================

LineAssembler::LineAssembler(size_t max_line_length) : max_line_length_(max_line_length) {}

void LineAssembler::feed(const char* data, size_t size) {
    for (size_t i = 0; i < size; ++i) {
        char c = data[i];
        if (c == '\n') {
            if (!discarding_) {
                if (!partial_.empty() && partial_.back() == '\r') {
                    partial_.pop_back();
                }
                if (!partial_.empty()) {
                    lines_.push_back(std::move(partial_));
                }
            }
            partial_.clear();
            discarding_ = false;
            continue;
        }

        if (discarding_) {
            continue;
        }

        partial_.push_back(c);
        if (partial_.size() > max_line_length_) {
            spdlog::warn("[LineAssembler] Record exceeds {} bytes without newline, discarding",
                         max_line_length_);
            partial_.clear();
            discarding_ = true;
            overflow_count_++;
        }
    }
}

std::optional<std::string> LineAssembler::next_line() {
    if (lines_.empty()) {
        return std::nullopt;
    }
    std::string line = std::move(lines_.front());
    lines_.pop_front();
    return line;
}

void LineAssembler::clear() {
    partial_.clear();
    lines_.clear();
    discarding_ = false;
}

} // namespace rocketscope
