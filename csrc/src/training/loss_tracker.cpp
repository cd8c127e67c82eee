// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "loss_tracker.h"

#include <fmt/core.h>

LossWindow::LossWindow(int capacity) : mCapacity(capacity) {
    if (capacity <= 0) {
        throw std::invalid_argument(fmt::format("Loss window capacity must be positive, got {}", capacity));
    }
    mValues.reserve(capacity);
}

void LossWindow::record(float value) {
    double v_n = value;
    if (static_cast<int>(mValues.size()) < mCapacity) {
        mValues.push_back(value);
        mSum += v_n;
    } else {
        // evict the oldest value
        double v_o = mValues[mIndex];
        mSum += v_n - v_o;
        mValues[mIndex] = value;
        mIndex = (mIndex + 1) % mCapacity;
    }

    // periodically recompute to prevent accumulation of
    // rounding errors
    if (mIndex == 0 && static_cast<int>(mValues.size()) == mCapacity) {
        re_evaluate();
    }
}

double LossWindow::average() const {
    if (mValues.empty()) {
        throw EmptyWindowError("Loss window queried before any value was recorded");
    }
    return mSum / static_cast<double>(mValues.size());
}

std::vector<float> LossWindow::values() const {
    std::vector<float> ordered;
    ordered.reserve(mValues.size());
    for (std::size_t i = 0; i < mValues.size(); ++i) {
        ordered.push_back(mValues[(mIndex + i) % mValues.size()]);
    }
    return ordered;
}

LossWindowState LossWindow::state() const {
    return LossWindowState{mCapacity, mIndex, mValues};
}

/**
 * @brief Replace the window contents with a saved state.
 *
 * @throws std::invalid_argument If the state is inconsistent (index out of range, too many values,
 *         or a non-zero index for a window that is not full).
 */
void LossWindow::reset(const LossWindowState& state) {
    const int n = static_cast<int>(state.Values.size());
    if (state.Capacity <= 0 || n > state.Capacity || state.Index < 0 ||
        state.Index >= state.Capacity || (n < state.Capacity && state.Index != 0)) {
        throw std::invalid_argument(fmt::format("Invalid loss window state: capacity {}, index {}, {} values",
                                                state.Capacity, state.Index, n));
    }
    mCapacity = state.Capacity;
    mIndex = state.Index;
    mValues = state.Values;
    mValues.reserve(mCapacity);
    re_evaluate();
}

void LossWindow::clear() {
    mValues.clear();
    mIndex = 0;
    mSum = 0.0;
}

void LossWindow::re_evaluate() {
    mSum = 0.0;
    for (float val : mValues) {
        mSum += val;
    }
}

LossTracker::LossTracker(int capacity, const std::vector<std::string>& names) {
    for (const auto& name : names) {
        mWindows.emplace(name, LossWindow(capacity));
    }
}

LossWindow& LossTracker::find(const std::string& name) {
    auto found = mWindows.find(name);
    if (found == mWindows.end()) {
        throw std::out_of_range(fmt::format("Unknown loss component `{}`", name));
    }
    return found->second;
}

const LossWindow& LossTracker::window(const std::string& name) const {
    auto found = mWindows.find(name);
    if (found == mWindows.end()) {
        throw std::out_of_range(fmt::format("Unknown loss component `{}`", name));
    }
    return found->second;
}

void LossTracker::record(const std::string& name, float value) {
    find(name).record(value);
}

double LossTracker::average(const std::string& name) const {
    return window(name).average();
}

std::vector<std::string> LossTracker::names() const {
    std::vector<std::string> result;
    for (const auto& [name, w] : mWindows) {
        result.push_back(name);
    }
    return result;
}

std::map<std::string, LossWindowState> LossTracker::state() const {
    std::map<std::string, LossWindowState> result;
    for (const auto& [name, w] : mWindows) {
        result.emplace(name, w.state());
    }
    return result;
}

void LossTracker::reset(const std::map<std::string, LossWindowState>& state) {
    if (state.size() != mWindows.size()) {
        throw std::invalid_argument(fmt::format("Expected {} loss windows, got {}", mWindows.size(), state.size()));
    }
    for (const auto& [name, s] : state) {
        find(name).reset(s);
    }
}
