// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include <chrono>
#include <cstdio>
#include <cstdint>
#include <cstdlib>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>
#include <fmt/chrono.h>
#include <fmt/core.h>

#include "models/byte_tokenizer.h"
#include "models/directory_pair_source.h"
#include "models/pooling_encoder.h"
#include "models/ppm_image.h"
#include "models/ppm_renderer.h"
#include "models/registry.h"
#include "runtime/optimizers/adamw.h"
#include "training/checkpoint.h"
#include "training/latent_cache.h"
#include "training/logging.h"
#include "training/loss_tracker.h"
#include "training/pairs.h"
#include "training/schedule.h"
#include "training/timesteps.h"
#include "training/trainer.h"
#include "utilities/comm.h"
#include "utilities/utils.h"
#include "utilities/worker_pool.h"

namespace {

//! Lowest learning rate of the cosine schedule.
constexpr float MinLearningRate = 1e-6f;

//! Seed of the noise mixed into the inference preview.
constexpr std::uint64_t PreviewSeed = 42;

} // namespace

/**
 * @brief End-to-end training runner: CLI parsing, dataset caching, worker setup and the training loop.
 *
 * Parameters are stored as public fields so CLI11 can bind options directly.
 */
struct TrainingRunner {
    /// Resume from the latest checkpoint.
    bool Resume = false;
    /// Registered model architecture.
    std::string ModelName = "flow-tiny";
    /// Peak learning rate of the cosine schedule.
    float LearningRate = 5e-5f;
    /// Raw batch size; one cache shard holds this many samples.
    int BatchSize = 4;
    /// Shards combined into one training step.
    int CacheBatchSize = 2;
    /// Side of the raw images; latents have side ImageSize / 8.
    int ImageSize = 256;
    int PatchSize = 2;
    bool GradientCheckpointing = false;
    float DiffusionLossWeight = 5.f;
    /// Token sequence length, EOS terminated and padded.
    int MaxLength = 128;

    int DebugSteps = 20;
    int InferenceSteps = 200;
    int SaveSteps = 200;

    /// Rebuild the latent cache even if it is complete.
    bool ForceCache = false;
    int NumEpochs = 10;
    /// Optional cap on the global step (-1 runs all epochs).
    long MaxSteps = -1;
    int LossWindow = 100;
    std::uint64_t Seed = 42;

    std::vector<std::string> Sources = {"source"};
    std::string PairsFile = "pairs.json";
    std::string CacheDir = "dataset_cache";
    int CacheWorkers = 8;
    std::string CacheStrategy = "threads";

    /// Checkpoint directory template (%n expanded).
    std::string CkptDir = "checkpoints";
    /// Number of checkpoints to keep (-1 keeps all).
    int CkptToKeep = -1;
    /// Every Nth checkpoint survives the cleanup (-1 disables).
    int MajorCkptEvery = -1;
    /// Directory template for diagnostic images (%n expanded).
    std::string OutputDir = "inference_results";

    /// Number of data-parallel workers.
    int Workers = 1;

    /// Human-readable run name used in paths/logs (supports %n expansion in templates).
    std::string RunName = "transfuse";
    /// Log file template (%n expanded).
    std::string LogFile = fmt::format("logs/%n-{:%FT%H_%M}.json", std::chrono::system_clock::now());
    int Verbosity = TrainingRunLogger::DEFAULT;

    /// Startup timestamp used to report setup time.
    std::chrono::steady_clock::time_point BeginStartup;

    /**
     * @brief Parse command-line options into this runner's fields (CLI11).
     * @param argc Argument count.
     * @param argv Argument vector.
     * @return 0 to continue, otherwise the exit code (e.g. after `--help`).
     */
    int load_training_config(int argc, const char** argv);

    /**
     * @brief Launch one training worker per `--workers` on the threads backend and wait for them.
     */
    void launch_training(int argc, const char** argv);

    /**
     * @brief Execute the full training run on the current worker.
     * @param comm Communicator providing rank/world_size and barriers.
     */
    void run_training(int argc, const char** argv, Communicator& comm);

    /**
     * @brief Build the pair list and the latent cache on rank 0.
     * @return Number of shards in the cache.
     */
    int prepare_cache(TrainingRunLogger& logger, const ITokenizer& tokenizer, const IImageReader& images,
                      const IEncoder& encoder) const;

    /**
     * @brief Decode the first cached sample and set up the inference preview.
     */
    void prepare_preview(const CachedDataset& dataset, const IEncoder& encoder,
                         models::PpmDiagnosticRenderer& renderer) const;
};

int TrainingRunner::load_training_config(int argc, const char** argv) {
    BeginStartup = std::chrono::steady_clock::now();
    CLI::App app{"Multimodal text and image training over a cached latent dataset"};

    app.add_flag("--resume", Resume, "Resume from the latest checkpoint");
    app.add_option("--model_name,--model-name", ModelName, "Model architecture");
    app.add_option("--learning_rate,--lr", LearningRate, "Peak learning rate of the cosine schedule")->check(CLI::PositiveNumber);
    app.add_option("--batch_size,--batch-size", BatchSize, "Raw batch size used for caching")->check(CLI::PositiveNumber);
    app.add_option("--cache_batch_size,--cache-batch-size", CacheBatchSize, "Number of cached shards per training step")->check(CLI::PositiveNumber);
    app.add_option("--image_size,--image-size", ImageSize, "Side of the raw images")->check(CLI::PositiveNumber);
    app.add_option("--patch_size,--patch-size", PatchSize, "Side of a latent patch")->check(CLI::PositiveNumber);
    app.add_flag("--gradient_checkpointing,--gradient-checkpointing", GradientCheckpointing, "Enable gradient checkpointing in the model");
    app.add_option("--diffusion_loss_weight,--diffusion-loss-weight", DiffusionLossWeight, "Weight of the diffusion loss")->check(CLI::NonNegativeNumber);
    app.add_option("--max_length,--max-length", MaxLength, "Token sequence length")->check(CLI::PositiveNumber);

    app.add_option("--debug_steps,--debug-steps", DebugSteps, "Render debug images every n steps (<= 0 disables)");
    app.add_option("--inference_steps,--inference-steps", InferenceSteps, "Render an inference preview every n steps (<= 0 disables)");
    app.add_option("--save_steps,--save-steps", SaveSteps, "Save a checkpoint every n steps (<= 0 disables)");

    app.add_flag("--cache", ForceCache, "Rebuild the latent cache");
    app.add_option("--epochs", NumEpochs, "Number of epochs")->check(CLI::PositiveNumber);
    app.add_option("--steps", MaxSteps, "Stop once this global step is reached (-1 runs all epochs)");
    app.add_option("--loss-window", LossWindow, "Number of steps in the loss moving averages")->check(CLI::PositiveNumber);
    app.add_option("--seed", Seed, "Seed for model initialization, noise and timesteps");

    app.add_option("--source", Sources, "Directories holding <name>.ppm images and <name>.txt captions");
    app.add_option("--pairs-file", PairsFile, "Where the text/image pair list is cached");
    app.add_option("--cache-dir", CacheDir, "Directory of the latent cache");
    app.add_option("--cache-workers", CacheWorkers, "Maximum number of concurrent shard encoders")->check(CLI::PositiveNumber);
    app.add_option("--cache-strategy", CacheStrategy, "How shards are encoded: threads or inline")
        ->check(CLI::IsMember({"threads", "inline"}, CLI::ignore_case));

    app.add_option("--checkpoint-dir", CkptDir, "Directory in which to save checkpoints.");
    app.add_option("--ckpt-keep-n", CkptToKeep, "Clean up old checkpoints, only preserving the latest n.");
    app.add_option("--ckpt-major", MajorCkptEvery, "Make every nth checkpoint a major checkpoint, which does not get cleaned up.");
    app.add_option("--output-dir", OutputDir, "Directory for debug and inference images");
    app.add_option("--workers", Workers, "Number of data-parallel workers")->check(CLI::PositiveNumber);

    app.add_option("--name", RunName, "Associate a name with this run. You can use %n as part of specifying log, output, and checkpoint paths.");
    app.add_option("--log-file", LogFile, "Where to save the training log");
    app.add_option("--verbosity", Verbosity, "-2 silent, -1 quiet, 0 default, 1 verbose")->check(CLI::Range(-2, 1));

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        int code = app.exit(e);
        return code == 0 ? -1 : code;
    }

    if (ImageSize % 8 != 0) {
        throw std::invalid_argument(fmt::format("--image_size must be a multiple of 8, got {}", ImageSize));
    }
    if ((ImageSize / 8) % PatchSize != 0) {
        throw std::invalid_argument(fmt::format("latent side {} is not divisible by --patch_size {}", ImageSize / 8, PatchSize));
    }

    LogFile = replace_all(LogFile, "%n", RunName);
    CkptDir = replace_all(CkptDir, "%n", RunName);
    OutputDir = replace_all(OutputDir, "%n", RunName);
    return 0;
}

void TrainingRunner::launch_training(int argc, const char** argv) {
    Communicator::run_communicators(Workers, [&](Communicator& comm) { run_training(argc, argv, comm); });
}

int TrainingRunner::prepare_cache(TrainingRunLogger& logger, const ITokenizer& tokenizer, const IImageReader& images,
                                  const IEncoder& encoder) const {
    models::DirectoryPairSource source;
    std::vector<TextImagePair> pairs = ensure_pairs(PairsFile, source, Sources);
    logger.log_message(0, fmt::format("{} text/image pairs from `{}`", pairs.size(), PairsFile));

    LatentCacheConfig config;
    config.Directory = CacheDir;
    config.MaxLength = MaxLength;
    config.ImageSize = ImageSize;
    config.ShowProgress = logger.verbosity() >= TrainingRunLogger::DEFAULT;
    LatentCache cache(config, tokenizer, images, encoder,
                      WorkerPool(worker_strategy_from_str(CacheStrategy), CacheWorkers));

    CacheBuildResult result;
    {
        auto log = logger.log_section_start(0, fmt::format("Preparing latent cache in `{}`", CacheDir));
        result = cache.build(pairs, BatchSize, ForceCache);
    }
    logger.log_cache(CacheDir, BatchSize, result.NumShards, result.Built);
    return result.NumShards;
}

void TrainingRunner::prepare_preview(const CachedDataset& dataset, const IEncoder& encoder,
                                     models::PpmDiagnosticRenderer& renderer) const {
    TensorAllocator allocator;
    const auto& shape = dataset.latent_shape();
    const long bs = dataset.batch_size();
    Tensor ids = allocator.allocate(ETensorDType::INT32, "input_ids", {bs, (long)dataset.max_length()});
    Tensor latents = allocator.allocate(ETensorDType::FP32, "latents", {bs, shape.at(0), shape.at(1), shape.at(2)});
    dataset.load(0, ids, latents);

    Tensor first = slice(latents, 0, 0, 1);
    Tensor image = allocator.allocate(ETensorDType::FP32, "sample", {1, 3, shape.at(1) * encoder.downsample_factor(),
                                                                     shape.at(2) * encoder.downsample_factor()});
    encoder.decode(first, image);
    renderer.save_sample(image, "sample_latents_epoch_0");

    // half signal, half noise
    Tensor preview = allocator.allocate(ETensorDType::FP32, "preview", {1, shape.at(0), shape.at(1), shape.at(2)});
    std::mt19937_64 gen(PreviewSeed);
    std::normal_distribution<float> normal(0.f, 1.f);
    const float* src = first.get<float>();
    float* dst = preview.get<float>();
    for (long i = 0; i < preview.nelem(); ++i) {
        dst[i] = 0.5f * src[i] + 0.5f * normal(gen);
    }
    renderer.set_preview(preview);
}

void TrainingRunner::run_training(int argc, const char** argv, Communicator& comm) {
    TrainingRunLogger logger(LogFile, comm.rank(), static_cast<TrainingRunLogger::EVerbosity>(Verbosity));
    logger.log_cmd(argc, argv);

    models::ByteTokenizer tokenizer;
    models::PpmImageReader images;
    models::PoolingEncoder encoder;

    // Rank 0 builds the cache, everyone else waits for it
    if (comm.is_root()) {
        prepare_cache(logger, tokenizer, images, encoder);
    }
    comm.barrier();

    CachedDataset dataset(CacheDir, BatchSize);

    models::ModelConfig model_config;
    model_config.VocabSize = tokenizer.vocab_size();
    model_config.PadTokenId = tokenizer.pad_token_id();
    model_config.LatentChannels = encoder.latent_channels();
    model_config.PatchSize = PatchSize;
    model_config.DiffusionLossWeight = DiffusionLossWeight;
    model_config.GradientCheckpointing = GradientCheckpointing;
    model_config.Seed = Seed;
    std::unique_ptr<IModel> model = models::create_model(ModelName, model_config);
    logger.log_model(ModelName, model->num_parameters(), comm.world_size());

    optimizers::AdamWConfig adamw;
    adamw.learning_rate = LearningRate;
    optimizers::AdamWOptimizer optimizer(model->parameters(), model->gradients(), adamw);

    const int steps_per_epoch = dataset.size() / CacheBatchSize / comm.world_size();
    const long t_max = static_cast<long>(NumEpochs) * steps_per_epoch / 2;
    LRScheduler scheduler(optimizer, std::make_unique<CosineSchedule>(LearningRate, t_max, 0, MinLearningRate));

    TimestepScheduler timesteps(DebugSteps, InferenceSteps, Seed);
    LossTracker losses(LossWindow);
    CheckpointManager checkpoints(CkptDir, comm);
    models::PpmDiagnosticRenderer renderer(OutputDir, encoder);

    logger.log_options({
        {"name",                   RunName},
        {"model-name",             ModelName},
        {"learning-rate",          LearningRate},
        {"min-learning-rate",      MinLearningRate},
        {"cosine-t-max",           static_cast<std::int64_t>(t_max)},
        {"batch-size",             BatchSize},
        {"cache-batch-size",       CacheBatchSize},
        {"image-size",             ImageSize},
        {"patch-size",             PatchSize},
        {"gradient-checkpointing", GradientCheckpointing},
        {"diffusion-loss-weight",  DiffusionLossWeight},
        {"max-length",             MaxLength},
        {"debug-steps",            DebugSteps},
        {"inference-steps",        InferenceSteps},
        {"save-steps",             SaveSteps},
        {"epochs",                 NumEpochs},
        {"steps",                  static_cast<std::int64_t>(MaxSteps)},
        {"steps-per-epoch",        steps_per_epoch},
        {"loss-window",            LossWindow},
        {"seed",                   static_cast<std::int64_t>(Seed)},
        {"pairs-file",             PairsFile},
        {"cache-dir",              CacheDir},
        {"cache-workers",          CacheWorkers},
        {"cache-strategy",         CacheStrategy},
        {"rebuild-cache",          ForceCache},
        {"checkpoint-dir",         CkptDir},
        {"ckpt-keep",              CkptToKeep},
        {"ckpt-major",             MajorCkptEvery},
        {"output-dir",             OutputDir},
        {"workers",                comm.world_size()},
        {"log-file",               LogFile},
    });

    if (comm.is_root()) {
        prepare_preview(dataset, encoder, renderer);
    }

    TrainingOptions options;
    options.Epochs = NumEpochs;
    options.MaxSteps = MaxSteps;
    options.CacheBatchSize = CacheBatchSize;
    options.PatchSize = PatchSize;
    options.DebugSteps = DebugSteps;
    options.InferenceSteps = InferenceSteps;
    options.SaveSteps = SaveSteps;
    options.CheckpointsToKeep = CkptToKeep;
    options.MajorCheckpointEvery = MajorCkptEvery;

    TrainingComponents components;
    components.Model = model.get();
    components.Optimizer = &optimizer;
    components.Scheduler = &scheduler;
    components.Timesteps = &timesteps;
    components.Losses = &losses;
    components.Dataset = &dataset;
    components.Checkpoints = &checkpoints;
    components.Renderer = &renderer;
    components.Logger = &logger;
    components.Comm = &comm;
    TrainingLoop loop(components, options);

    if (Resume) {
        auto log = logger.log_section_start(0, fmt::format("Loading latest checkpoint from `{}`", CkptDir));
        TrainingState state = checkpoints.resume();
        loop.adopt(state);
        logger.log_message(0, fmt::format("Resuming at step {} (epoch {}, batch {})", loop.step(), loop.epoch(), loop.batch_in_epoch()));
    }

    logger.log_message(0, fmt::format("Starting training: {} epochs of {} steps", NumEpochs, loop.steps_per_epoch()));
    logger.log_message(0, fmt::format("Setup took {} seconds",
        std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - BeginStartup).count()));

    long taken = loop.run();
    logger.log_message(loop.step(), fmt::format("Done. {} steps, last loss {:.4f}", taken, loop.last_loss()));
}

int main(int argc, const char** argv) {
    try {
        TrainingRunner runner;
        if (int code = runner.load_training_config(argc, argv); code != 0) {
            return code < 0 ? EXIT_SUCCESS : code;
        }
        runner.launch_training(argc, argv);
        return 0;
    } catch (const std::exception& e) {
        ::fprintf(stderr, "ERROR: %s\n", e.what());
        fflush(stderr);
        return EXIT_FAILURE;
    }
}
