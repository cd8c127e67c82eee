// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "checkpoint.h"

#include <algorithm>
#include <bit>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>

#include <nlohmann/json.hpp>
#include <fmt/core.h>

#include "utilities/comm.h"
#include "utilities/safetensors.h"

namespace {

// Losses are stored by bit pattern; JSON has no representation for NaN or infinity.
std::uint32_t float_to_bits(float value) {
    return std::bit_cast<std::uint32_t>(value);
}

float float_from_bits(const nlohmann::json& bits) {
    return std::bit_cast<float>(bits.get<std::uint32_t>());
}

//! Parses `step_XXXXXXXX`; -1 for anything else (including unfinished `.tmp` directories).
long parse_checkpoint_step(const std::string& name) {
    if (!name.starts_with("step_") || name.size() == 5) {
        return -1;
    }
    std::string digits = name.substr(5);
    if (!std::all_of(digits.begin(), digits.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        return -1;
    }
    return std::stol(digits);
}

nlohmann::json windows_to_json(const std::map<std::string, LossWindowState>& windows) {
    nlohmann::json result = nlohmann::json::object();
    for (const auto& [name, window] : windows) {
        std::vector<std::uint32_t> bits;
        bits.reserve(window.Values.size());
        for (float v : window.Values) {
            bits.push_back(float_to_bits(v));
        }
        result[name] = nlohmann::json::object({
            {"capacity", window.Capacity},
            {"index", window.Index},
            {"values", bits},
        });
    }
    return result;
}

std::map<std::string, LossWindowState> windows_from_json(const nlohmann::json& data) {
    std::map<std::string, LossWindowState> result;
    for (const auto& el : data.items()) {
        LossWindowState window;
        window.Capacity = el.value().at("capacity").get<int>();
        window.Index = el.value().at("index").get<int>();
        for (const auto& bits : el.value().at("values")) {
            window.Values.push_back(float_from_bits(bits));
        }
        result.emplace(el.key(), std::move(window));
    }
    return result;
}

} // namespace

/**
 * @brief Build the full checkpoint path for a given training step.
 *
 * This appends a `step_XXXXXXXX` directory name (zero-padded to 8 digits) to the
 * provided checkpoint directory.
 *
 * @param checkpoint_directory Base directory in which checkpoints are stored.
 * @param step Training step number used to form the subdirectory name.
 * @return Full path to the checkpoint directory for @p step.
 */
std::string get_checkpoint_path(std::string checkpoint_directory, long step) {
    checkpoint_directory += fmt::format("/step_{:08}", step);
    return checkpoint_directory;
}

CheckpointManager::CheckpointManager(std::string directory, Communicator& comm) :
    mDirectory(std::move(directory)), mComm(&comm) {
}

/**
 * @brief Save a checkpoint of the complete training state.
 *
 * Rank 0 writes `model.safetensors`, `optimizer.safetensors` and `checkpoint.json` into
 * `step_XXXXXXXX.tmp`, then renames the directory to `step_XXXXXXXX`. All ranks synchronize
 * once the rename is done.
 *
 * @param state Snapshot to persist.
 * @param loss Loss of the last completed step.
 * @return The full path to the checkpoint directory.
 *
 * @throws std::filesystem::filesystem_error If directory creation or file operations fail.
 * @throws std::exception Propagates errors thrown by safetensors writing utilities.
 */
std::string CheckpointManager::save(TrainingState& state, float loss) {
    std::string target = get_checkpoint_path(mDirectory, state.Step);

    if (mComm->rank() == 0) {
        std::string staging = target + ".tmp";
        std::filesystem::remove_all(staging);
        std::filesystem::create_directories(staging);

        write_safetensors(staging + "/model.safetensors", state.ModelParameters);
        write_safetensors(staging + "/optimizer.safetensors", state.Optimizer.Tensors);

        nlohmann::json meta_data;
        meta_data["run"] = nlohmann::json::object({
            {"epoch", state.Epoch},
            {"step", state.Step},
            {"batch_in_epoch", state.BatchInEpoch},
            {"loss", float_to_bits(loss)},
            {"rng", state.TimestepRng},
        });
        meta_data["scheduler"] = nlohmann::json::object({{"last_step", state.SchedulerStep}});
        meta_data["optimizer"] = state.Optimizer.Scalars;
        meta_data["loss_windows"] = windows_to_json(state.LossWindows);
        meta_data["distributed"] = nlohmann::json::object({{"world", mComm->world_size()}});

        {
            std::ofstream file(staging + "/checkpoint.json");
            if (!file.is_open()) {
                throw std::runtime_error(fmt::format("could not open {} for writing", staging + "/checkpoint.json"));
            }
            file << std::setw(2) << meta_data;
            if (!file.good()) {
                throw std::runtime_error(fmt::format("error writing {}", staging + "/checkpoint.json"));
            }
        }

        std::filesystem::remove_all(target);
        std::filesystem::rename(staging, target);
    }

    mComm->barrier();  // nobody continues before the checkpoint is complete
    return target;
}

/**
 * @brief Load the checkpoint of a given step into a fresh TrainingState.
 *
 * @param step Training step number identifying which checkpoint to load.
 * @return The restored state; nothing else is modified.
 *
 * @throws CheckpointNotFoundError If the checkpoint directory does not exist.
 * @throws std::runtime_error If checkpoint.json cannot be opened, or the checkpoint
 *         was written with a different number of workers.
 */
TrainingState CheckpointManager::load(long step) const {
    std::string source = get_checkpoint_path(mDirectory, step);
    if(!std::filesystem::exists(source)) {
        throw CheckpointNotFoundError("Checkpoint not found: " + source);
    }

    std::ifstream file(source + "/checkpoint.json");
    if(!file.is_open()) {
        throw std::runtime_error(fmt::format("could not open checkpoint file {}", source + "/checkpoint.json"));
    }
    nlohmann::json meta_data = nlohmann::json::parse(file);

    if(int ws = meta_data["distributed"]["world"].get<int>(); ws != mComm->world_size()) {
        throw std::runtime_error(
            fmt::format("Loading checkpoints with different world size is not supported: current {}, checkpoint {}",
                        mComm->world_size(), ws));
    }

    TrainingState state;
    const auto& run = meta_data.at("run");
    state.Epoch = run.at("epoch").get<int>();
    state.Step = run.at("step").get<long>();
    state.BatchInEpoch = run.at("batch_in_epoch").get<int>();
    state.LastLoss = float_from_bits(run.at("loss"));
    state.TimestepRng = run.at("rng").get<std::string>();
    state.SchedulerStep = meta_data.at("scheduler").at("last_step").get<long>();
    state.Optimizer.Scalars = meta_data.at("optimizer").get<std::map<std::string, double>>();
    state.LossWindows = windows_from_json(meta_data.at("loss_windows"));

    SafeTensorsReader(source + "/model.safetensors").read_all(state.ModelParameters);
    SafeTensorsReader(source + "/optimizer.safetensors").read_all(state.Optimizer.Tensors);
    return state;
}

TrainingState CheckpointManager::resume() const {
    long latest = find_latest_checkpoint(mDirectory);
    if (latest < 0) {
        throw CheckpointNotFoundError(fmt::format("No checkpoint to resume from in `{}`", mDirectory));
    }
    return load(latest);
}

bool CheckpointManager::has_checkpoint() const {
    return find_latest_checkpoint(mDirectory) >= 0;
}

/**
 * @brief List all available checkpoint step numbers in a directory.
 *
 * Scans immediate subdirectories of @p checkpoint_directory for names of the form
 * `step_<digits>`; staging directories (`step_<digits>.tmp`) are skipped.
 *
 * @param checkpoint_directory Base directory in which checkpoints are stored.
 * @return Sorted vector of discovered checkpoint steps.
 */
std::vector<long> get_all_checkpoints(const std::string& checkpoint_directory) {
    std::filesystem::path path(checkpoint_directory);
    if (!exists(path)) {
        return {};
    }
    std::vector<long> checkpoints;
    for(const auto& entry : std::filesystem::directory_iterator(path)) {
        if(entry.is_directory()) {
            long step = parse_checkpoint_step(entry.path().filename().string());
            if(step >= 0) {
                checkpoints.push_back(step);
            }
        }
    }
    std::sort(checkpoints.begin(), checkpoints.end());
    return checkpoints;
}

long find_latest_checkpoint(const std::string& checkpoint_directory) {
    auto checkpoints = get_all_checkpoints(checkpoint_directory);
    return checkpoints.empty() ? -1 : checkpoints.back();
}

/**
 * @brief Remove older checkpoints while keeping the newest N and optionally preserving "major" ones.
 *
 * @param checkpoint_directory Base directory in which checkpoints are stored.
 * @param n_to_keep Number of (non-major) checkpoints to keep (newest retained); negative keeps all.
 * @param major_every If > 0, checkpoints where `step % major_every == 0` are preserved.
 * @return List of filesystem paths that were removed.
 *
 * @throws std::filesystem::filesystem_error If removal fails.
 */
std::vector<std::string> clean_old_checkpoints(const std::string& checkpoint_directory, int n_to_keep, int major_every) {
    auto checkpoints = get_all_checkpoints(checkpoint_directory);
    if(n_to_keep < 0 || checkpoints.size() <= static_cast<std::size_t>(n_to_keep)) {
        return {};
    }

    std::vector<std::string> removed;
    // leave major checkpoints untouched
    if(major_every > 0) {
        std::erase_if(checkpoints, [&](long step) { return step % major_every == 0; });
    }
    for(std::size_t i = 0; i + n_to_keep < checkpoints.size(); ++i) {
        std::string path = get_checkpoint_path(checkpoint_directory, checkpoints[i]);
        removed.push_back(path);
        std::filesystem::remove_all(path);
    }

    return removed;
}
