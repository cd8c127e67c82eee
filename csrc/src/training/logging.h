// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef TRANSFUSE_SRC_TRAINING_LOGGING_H
#define TRANSFUSE_SRC_TRAINING_LOGGING_H

#include <chrono>
#include <cstdint>
#include <fstream>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

//! Everything reported for one optimization step.
struct StepReport {
    long Step = 0;
    float Epoch = 0.f;          ///< fractional epoch progress
    int DurationMs = 0;
    float Loss = 0.f;           ///< total loss of this step
    float TextAverage = 0.f;    ///< moving average of the text loss
    float DiffusionAverage = 0.f;
    float LearningRate = 0.f;
};

class TrainingRunLogger
{
public:
    enum EVerbosity {
        SILENT = -2,
        QUIET = -1,
        DEFAULT = 0,
        VERBOSE = 1
    };

    //! An empty `file_name` disables the JSON log file; the callback still receives every line.
    TrainingRunLogger(const std::string& file_name, int rank, EVerbosity verbosity);
    ~TrainingRunLogger();

    void set_callback(std::function<void(std::string_view)> cb);

    void log_cmd(int argc, const char** argv);
    void log_options(const std::vector<std::pair<std::string_view, std::variant<bool, std::int64_t, float, std::string>>>& options);
    void log_model(const std::string& name, long num_parameters, int world_size);
    void log_cache(const std::string& directory, int batch_size, int num_shards, bool rebuilt);
    void log_step(const StepReport& report);

    // call at the beginning and end of a section of processing.
    // will record the time between the two calls
    class RAII_Section {
    public:
        ~RAII_Section() noexcept {
            if(mLogger)
                mLogger->log_section_end();
        };
    private:
        RAII_Section(TrainingRunLogger* l) : mLogger(l) {}
        RAII_Section(RAII_Section&&) = default;
        TrainingRunLogger* mLogger;

        friend class TrainingRunLogger;
    };

    void log_message(long step, const std::string& msg);
    RAII_Section log_section_start(long step, const std::string& info);
    void log_section_end();

    [[nodiscard]] int rank() const { return mRank; }
    [[nodiscard]] EVerbosity verbosity() const { return mVerbosity; }

private:
    void log_line(std::string_view line);
    std::string mFileName;
    std::fstream mLogFile;
    bool mFirst = true;

    int mRank;
    EVerbosity mVerbosity;

    float mPreviousLoss = -1.f;

    // arbitrary callback for log lines
    std::function<void(std::string_view)> mCallback;

    // log section is a two-step process, here we safe intermediaries
    std::string mSectionInfo;
    long mSectionStep = 0;
    std::chrono::steady_clock::time_point mSectionStart;
};

#endif //TRANSFUSE_SRC_TRAINING_LOGGING_H
