// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef TRANSFUSE_SRC_TRAINING_LOSS_TRACKER_H
#define TRANSFUSE_SRC_TRAINING_LOSS_TRACKER_H

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

//! Raised when averaging a window that has not seen any value yet.
class EmptyWindowError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

//! Raw contents of a LossWindow, as stored in checkpoints.
struct LossWindowState {
    int Capacity = 0;
    int Index = 0;                  //!< slot that is overwritten next once the window is full
    std::vector<float> Values;      //!< ring-buffer storage order
};

//! \brief Fixed-capacity ring buffer of loss values with a running mean.
//! \details Once full, every new value replaces the oldest one.
class LossWindow {
public:
    explicit LossWindow(int capacity = 100);

    void record(float value);

    //! Arithmetic mean of the current contents. Throws EmptyWindowError if empty.
    [[nodiscard]] double average() const;

    [[nodiscard]] int size() const { return static_cast<int>(mValues.size()); }
    [[nodiscard]] int capacity() const { return mCapacity; }
    [[nodiscard]] bool empty() const { return mValues.empty(); }

    //! Contents from oldest to newest.
    [[nodiscard]] std::vector<float> values() const;

    [[nodiscard]] LossWindowState state() const;
    void reset(const LossWindowState& state);
    void clear();

private:
    void re_evaluate();

    int mCapacity;
    int mIndex = 0;
    std::vector<float> mValues;
    double mSum = 0.0;
};

//! \brief One LossWindow per named loss component.
class LossTracker {
public:
    explicit LossTracker(int capacity = 100, const std::vector<std::string>& names = {"text", "diffusion"});

    //! Throws std::out_of_range for a name the tracker was not created with.
    void record(const std::string& name, float value);
    [[nodiscard]] double average(const std::string& name) const;

    [[nodiscard]] const LossWindow& window(const std::string& name) const;
    [[nodiscard]] std::vector<std::string> names() const;

    [[nodiscard]] std::map<std::string, LossWindowState> state() const;
    //! Restores every window; names must match exactly.
    void reset(const std::map<std::string, LossWindowState>& state);

private:
    LossWindow& find(const std::string& name);
    std::map<std::string, LossWindow> mWindows;
};

#endif //TRANSFUSE_SRC_TRAINING_LOSS_TRACKER_H
