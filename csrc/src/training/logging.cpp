// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "logging.h"

#include <cmath>
#include <cstdio>
#include <filesystem>
#include <algorithm>
#include <stdexcept>

#include <fmt/core.h>
#include <fmt/chrono.h>
#include <nlohmann/json.hpp>

namespace {
//! Quoted and escaped JSON string literal.
std::string quoted(std::string_view value) {
    return nlohmann::json(std::string(value)).dump();
}
}

/**
 * @brief Create a logger that writes a JSON array to @p file_name (rank 0 only).
 *
 * On rank 0, ensures the parent directory exists, opens the file for output,
 * and initializes it as a JSON array (writes "[ ... ]").
 *
 * @param file_name Output path for the JSON log; empty to only print.
 * @param rank Worker rank; only rank 0 writes the JSON file and prints output.
 * @param verbosity Verbosity level controlling stdout printing.
 * @throws std::runtime_error If the log file cannot be opened.
 */
TrainingRunLogger::TrainingRunLogger(const std::string& file_name, int rank, EVerbosity verbosity) :
    mFileName(file_name), mRank(rank), mVerbosity(verbosity)
{
    if(mRank == 0 && !mFileName.empty()) {
        auto log_path = std::filesystem::path(mFileName).parent_path();
        if (!log_path.empty()) {
            std::filesystem::create_directories(log_path);
        }
        mLogFile.open(mFileName, std::fstream::out);
        if (!mLogFile.is_open()) {
            throw std::runtime_error(fmt::format("Could not open log file `{}`", mFileName));
        }
        mLogFile << "[\n";
        mLogFile << "\n]\n";
    }
}

TrainingRunLogger::~TrainingRunLogger()
{
    if(mLogFile.is_open()) mLogFile.close();
}

void TrainingRunLogger::set_callback(std::function<void(std::string_view)> cb) {
    mCallback = std::move(cb);
}

/**
 * @brief Log the command line used to launch the run (rank 0 only).
 *
 * @param argc Argument count.
 * @param argv Argument vector; expected to be @p argc entries.
 */
void TrainingRunLogger::log_cmd(int argc, const char** argv)
{
    if(mRank != 0) return;
    std::string cmd = fmt::format(R"(  {{"log": "cmd", "time": "{}", "step": 0, "cmd": [)", std::chrono::system_clock::now());
    for (int i = 0; i < argc; i++)
    {
        if (i != 0) cmd += ", ";
        cmd += ::quoted(argv[i]);
    }
    cmd += "]}";
    log_line(cmd);
}

/**
 * @brief Log configuration options (rank 0 only).
 *
 * Each option is written as a JSON log line, and printed in a table at VERBOSE level.
 *
 * @param options Vector of (name, value) pairs; value may be bool, int64, float, or std::string.
 */
void TrainingRunLogger::log_options(const std::vector<std::pair<std::string_view, std::variant<bool, std::int64_t, float, std::string>>>& options) {
    if(mRank != 0) return;

    int option_length = 0;
    for(auto& [name, value]: options) {
        option_length = std::max(option_length, static_cast<int>(name.size()));
    }

    for(auto& [name, value]: options) {
        auto log = [&](auto&& v){
            using value_t = std::remove_cvref_t<decltype(v)>;
            std::string formatted;
            if constexpr (std::is_same_v<value_t, std::string>) {
                formatted = ::quoted(v);
            } else {
                formatted = fmt::format("{}", v);
            }
            log_line(fmt::format(R"(  {{"log": "option", "time": "{}", "step": 0, "name": "{}", "value": {}}})",
                                 std::chrono::system_clock::now(), name, formatted));
            if(mVerbosity >= VERBOSE) {
                printf("  %-*s : %s\n", option_length, std::string(name).c_str(), formatted.c_str());
            }
        };
        std::visit(log, value);
    }
    if(mVerbosity >= VERBOSE) {
        printf("\n");
    }
}

void TrainingRunLogger::log_model(const std::string& name, long num_parameters, int world_size) {
    if(mRank != 0) return;
    if(mVerbosity >= 0) {
        printf("[Model]\n  %s : %ld parameters, %d worker(s)\n\n", name.c_str(), num_parameters, world_size);
    }
    log_line(fmt::format(R"(  {{"log": "info", "time": "{}", "step": 0, "message": {}, "parameters": {}, "world_size": {}}})",
                         std::chrono::system_clock::now(), ::quoted(name), num_parameters, world_size));
}

/**
 * @brief Record the state of the latent cache (rank 0 only).
 *
 * @param directory Cache directory.
 * @param batch_size Raw batch size the cache was built for.
 * @param num_shards Number of shards available.
 * @param rebuilt Whether the shards were (re)encoded in this run.
 */
void TrainingRunLogger::log_cache(const std::string& directory, int batch_size, int num_shards, bool rebuilt) {
    if(mRank != 0) return;
    if(mVerbosity >= 0) {
        printf("[Cache]\n  %s : %d shards of %d samples (%s)\n\n", directory.c_str(), num_shards, batch_size,
               rebuilt ? "encoded" : "reused");
    }
    log_line(fmt::format(R"(  {{"log": "cache", "time": "{}", "step": 0, "directory": {}, "batch_size": {}, "shards": {}, "rebuilt": {}}})",
                         std::chrono::system_clock::now(), ::quoted(directory), batch_size, num_shards, rebuilt));
}

/**
 * @brief Log a training step (rank 0 only).
 *
 * Prints a compact progress line with a loss trend indicator, the two moving averages
 * and the learning rate, and writes the matching JSON line.
 *
 * @param report Measurements of the step.
 */
void TrainingRunLogger::log_step(const StepReport& report)
{
    if(mRank != 0) return;

    if(mVerbosity >= 0) {
        float iptr;
        float progress = 100.f * std::modf(report.Epoch, &iptr);

        char trend = ' ';
        if (mPreviousLoss > 0) {
            if (report.Loss < mPreviousLoss) {
                trend = '\\';
            } else if (report.Loss > mPreviousLoss) {
                trend = '/';
            }
        }
        mPreviousLoss = report.Loss;

        printf(":: step %7ld [%5.1f%%] %c loss %6.4f | text %6.4f | diffusion %6.4f | lr %.3e | %5d ms\n",
               report.Step, progress, trend, report.Loss, report.TextAverage, report.DiffusionAverage,
               report.LearningRate, report.DurationMs);
        fflush(stdout);
    }
    log_line(fmt::format(R"(  {{"log": "step", "time": "{}", "step": {}, "epoch": {}, "duration_ms": {}, "loss": {}, "text_loss_avg": {}, "diffusion_loss_avg": {}, "lr": {}}})",
        std::chrono::system_clock::now(), report.Step, report.Epoch, report.DurationMs, report.Loss,
        report.TextAverage, report.DiffusionAverage, report.LearningRate));
}

void TrainingRunLogger::log_message(long step, const std::string& msg) {
    if(mRank != 0) return;
    if(mVerbosity >= 0) {
        fprintf(stdout, "%s\n", msg.c_str());
    }
    log_line(fmt::format(R"(  {{"log": "info", "time": "{}", "step": {}, "message": {}}})",
                         std::chrono::system_clock::now(), step, ::quoted(msg)));
}

/**
 * @brief Begin a timed logging section (rank 0 only).
 *
 * @param step Step associated with this section.
 * @param info Human-readable description printed to stdout and stored in JSON.
 * @return RAII_Section handle; on non-zero ranks, contains nullptr and is a no-op.
 */
TrainingRunLogger::RAII_Section TrainingRunLogger::log_section_start(long step, const std::string& info) {
    if(mRank != 0) return RAII_Section{nullptr};
    mSectionInfo = info;
    mSectionStep = step;
    mSectionStart = std::chrono::steady_clock::now();
    if(mVerbosity >= 0) {
        printf("%s ...\n", info.data());
    }
    return RAII_Section{this};
}

void TrainingRunLogger::log_section_end() {
    auto duration = std::chrono::steady_clock::now() - mSectionStart;
    long milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
    if(mRank != 0) return;
    log_line(fmt::format(R"(  {{"log": "info", "time": "{}", "step": {}, "message": {}, "duration_ms": {}}})",
                         std::chrono::system_clock::now(), mSectionStep, ::quoted(mSectionInfo), milliseconds));

    if(mVerbosity >= 0) {
        if(milliseconds < 2000) {
            printf("  done in %ld ms\n\n", milliseconds);
        } else {
            printf("  done in %ld s\n\n", milliseconds / 1000);
        }
    }
}

/**
 * @brief Append one JSON object line to the JSON array log file.
 *
 * The file is kept a valid JSON array after every call by overwriting the closing
 * bracket, which requires the file to always end in "\n]\n".
 *
 * @param line JSON object line to append.
 */
void TrainingRunLogger::log_line(std::string_view line) {
    if(mCallback)
        mCallback(line);

    if(!mLogFile.is_open()) return;

    mLogFile.seekp(-3, std::ios::end);  // overwrite the array closing part
    if (!mFirst)
    {
        mLogFile << ",\n";
    }
    mLogFile << line << "\n]" << std::endl;
    mFirst = false;
}
