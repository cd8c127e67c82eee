// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "comm.h"

#include <atomic>
#include <barrier>
#include <cstdio>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include <fmt/core.h>

Communicator::Communicator(int rank, int world) : mRank(rank), mWorld(world) {
    if (world <= 0 || rank < 0 || rank >= world)
        throw std::invalid_argument(fmt::format("Invalid communicator rank {} for world size {}", rank, world));
}

namespace {

class SingleCommunicator : public Communicator {
public:
    SingleCommunicator() : Communicator(0, 1) {}
    void barrier() override {}
};

/**
 * @brief Communicator backed by a std::barrier shared between worker threads of one process.
 */
class ThreadsCommunicator : public Communicator {
public:
    struct SharedState {
        std::unique_ptr<std::barrier<>> Barrier;
        std::vector<std::exception_ptr> Exceptions;
        std::vector<bool> Aborted;          ///< worker only failed because another one did
        std::atomic<bool> Failed = false;
        std::mutex Mutex;
    };

    ThreadsCommunicator(int rank, int world, std::shared_ptr<SharedState> state)
        : Communicator(rank, world), mShare(std::move(state)) {
    }

    //! Drops out of the shared barrier, so that a worker that exits early (e.g. with an exception)
    //! does not deadlock the others. The failure is published before the drop releases them.
    ~ThreadsCommunicator() override {
        if (mShare && mShare->Barrier && !mFinished) {
            mShare->Failed = true;
            mShare->Barrier->arrive_and_drop();
        }
    }

    void barrier() override {
        if (mShare->Failed) {
            throw WorkerAbortedError(fmt::format("worker {}: aborted, another worker failed", rank()));
        }
        mShare->Barrier->arrive_and_wait();
        if (mShare->Failed) {
            throw WorkerAbortedError(fmt::format("worker {}: aborted, another worker failed", rank()));
        }
    }

    //! Final synchronization point of a worker that completed its work normally.
    void finish() {
        mShare->Barrier->arrive_and_drop();
        mFinished = true;
    }

private:
    std::shared_ptr<SharedState> mShare;
    bool mFinished = false;
};

class CommunicatorThreadsPackImpl : public CommunicatorThreadsPack {
public:
    CommunicatorThreadsPackImpl(std::vector<std::jthread> threads,
                                std::shared_ptr<ThreadsCommunicator::SharedState> state)
        : mThreads(std::move(threads)), mState(std::move(state)) {}

    ~CommunicatorThreadsPackImpl() override {
        for (auto& t : mThreads) {
            if (t.joinable()) {
                t.join();
            }
        }
        if (has_exception()) {
            fprintf(stderr, "WARNING: worker exception discarded, join() was never called\n");
        }
    }

    void join() override {
        for (auto& t : mThreads) {
            if (t.joinable()) {
                t.join();
            }
        }
        check_exceptions();
    }

    bool has_exception() const override {
        std::lock_guard<std::mutex> lock(mState->Mutex);
        for (const auto& ex : mState->Exceptions) {
            if (ex) {
                return true;
            }
        }
        return false;
    }

private:
    //! Rethrows the exception of the first worker that failed on its own, if any.
    void check_exceptions() {
        std::lock_guard<std::mutex> lock(mState->Mutex);
        for (bool aborted : {false, true}) {
            for (size_t t = 0; t < mState->Exceptions.size(); ++t) {
                if (auto error = mState->Exceptions[t]; error && mState->Aborted[t] == aborted) {
                    fprintf(stderr, "Worker %zu exited with uncaught exception\n", t);
                    fflush(stderr);
                    mState->Exceptions[t] = nullptr;
                    std::rethrow_exception(error);
                }
            }
        }
    }

    std::vector<std::jthread> mThreads;
    std::shared_ptr<ThreadsCommunicator::SharedState> mState;
};

} // namespace

std::unique_ptr<Communicator> Communicator::make_single() {
    return std::make_unique<SingleCommunicator>();
}

/**
 * @brief Launch one worker thread per rank, each with its own ThreadsCommunicator.
 *
 * Each worker's exception is captured into the shared state and rethrown by
 * CommunicatorThreadsPack::join().
 *
 * @param nworkers Number of workers (must be positive).
 * @param work Callable invoked once per worker with that worker's communicator.
 * @return Joinable pack.
 */
std::unique_ptr<CommunicatorThreadsPack> Communicator::launch_communicators(int nworkers, std::function<void(Communicator& comm)> work) {
    if (nworkers <= 0) {
        throw std::invalid_argument(fmt::format("Invalid number of workers: {}", nworkers));
    }

    auto shared_state = std::make_shared<ThreadsCommunicator::SharedState>();
    shared_state->Barrier = std::make_unique<std::barrier<>>(nworkers);
    shared_state->Exceptions.resize(nworkers);
    shared_state->Aborted.resize(nworkers, false);

    auto shared_work = std::make_shared<std::function<void(Communicator&)>>(std::move(work));

    std::vector<std::jthread> threads;
    threads.reserve(nworkers);
    for (int rank = 0; rank < nworkers; ++rank) {
        threads.emplace_back([=]() {
            try {
                ThreadsCommunicator comm(rank, nworkers, shared_state);
                (*shared_work)(comm);
                comm.finish();
            } catch (const WorkerAbortedError&) {
                std::lock_guard<std::mutex> lock(shared_state->Mutex);
                shared_state->Exceptions[rank] = std::current_exception();
                shared_state->Aborted[rank] = true;
            } catch (...) {
                std::lock_guard<std::mutex> lock(shared_state->Mutex);
                shared_state->Exceptions[rank] = std::current_exception();
            }
        });
    }

    return std::make_unique<CommunicatorThreadsPackImpl>(std::move(threads), shared_state);
}

void Communicator::run_communicators(int nworkers, std::function<void(Communicator& comm)> work) {
    if (nworkers == 1) {
        auto comm = make_single();
        work(*comm);
        return;
    }
    auto pack = launch_communicators(nworkers, std::move(work));
    pack->join();
}
