#pragma once

#include <rd_utils/_.hh>
#include <cstdint>
#include <deque>
#include <functional>
#include <vector>

#include <fleetcmd/node/target.hh>
#include <fleetcmd/utils/logger.hh>

namespace fleetcmd::connector {

    /**
     * Runs a job on every target with a bounded number of workers
     * A worker takes the next queued target as soon as its current job terminates
     */
    class WorkerPool {
    public:

        typedef std::function <void (const node::NodeTarget &)> Job;

    private:

        // The targets not yet started
        std::deque <node::NodeTarget> _queue;

        // The job executed for each target
        Job _job;

        // The maximum number of jobs running at the same time
        uint32_t _maxConcurrency;

        // The running workers
        std::vector <rd_utils::concurrency::Thread> _threads;

        // Receives the failures of the jobs
        std::shared_ptr <utils::Logger> _log;

        rd_utils::concurrency::mutex _m;

    public:

        /**
         * @params:
         *    - targets: the targets to run the job on
         *    - job: the job to run, called once per target from a worker thread
         *    - maxConcurrency: the number of workers
         *    - log: the logger (null logger if nullptr)
         * @throws: ContractError if maxConcurrency is 0
         */
        WorkerPool (const std::vector <node::NodeTarget> & targets, Job job, uint32_t maxConcurrency, std::shared_ptr <utils::Logger> log = nullptr);

        WorkerPool (const WorkerPool &) = delete;
        void operator= (const WorkerPool &) = delete;

        /**
         * Run the job on every target, returns when every job is terminated
         */
        void execute ();

    private:

        /**
         * Worker loop, pops targets until the queue is empty
         */
        void work (rd_utils::concurrency::Thread);

        /**
         * Pop the next target
         * @returns: false if the queue is empty
         */
        bool next (node::NodeTarget & target);

    };

}
