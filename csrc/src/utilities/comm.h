// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef TRANSFUSE_SRC_UTILITIES_COMM_H
#define TRANSFUSE_SRC_UTILITIES_COMM_H

#include <functional>
#include <memory>
#include <stdexcept>

class Communicator;

//! Thrown from Communicator::barrier() on the surviving workers once another worker has failed.
class WorkerAbortedError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class CommunicatorThreadsPack {
public:
    virtual ~CommunicatorThreadsPack() = default;
    virtual void join() = 0;
    virtual bool has_exception() const = 0;
};

//! \brief Synchronization handle of one data-parallel worker.
//! \details The training core only needs barriers; gradient collectives are the
//! business of the model runtime.
class Communicator {
public:
    Communicator(int rank, int world);
    virtual ~Communicator() = default;

    //! Blocks until every worker has reached the barrier.
    //! Throws WorkerAbortedError if another worker has exited with an exception.
    virtual void barrier() = 0;

    [[nodiscard]] int rank() const { return mRank; }
    [[nodiscard]] int world_size() const { return mWorld; }
    [[nodiscard]] bool is_root() const { return mRank == 0; }

    //! A communicator for a single worker; barrier() returns immediately.
    static std::unique_ptr<Communicator> make_single();

    /**
     * @brief Run `work` on `nworkers` threads, one communicator each (blocking).
     *
     * A worker that throws makes the others fail at their next barrier. The original exception
     * is rethrown here after all threads ended.
     */
    static void run_communicators(int nworkers, std::function<void(Communicator& comm)> work);

    //! Same as run_communicators, but returns immediately with a joinable pack.
    static std::unique_ptr<CommunicatorThreadsPack> launch_communicators(int nworkers, std::function<void(Communicator& comm)> work);

private:
    int mRank;
    int mWorld;
};

#endif //TRANSFUSE_SRC_UTILITIES_COMM_H
