#include "pool.hh"
#include <fleetcmd/errors.hh>
#include <algorithm>

using namespace rd_utils;

namespace fleetcmd::connector {

    WorkerPool::WorkerPool (const std::vector <node::NodeTarget> & targets, Job job, uint32_t maxConcurrency, std::shared_ptr <utils::Logger> log)
        : _queue (targets.begin (), targets.end ())
        , _job (job)
        , _maxConcurrency (maxConcurrency)
        , _log (utils::orNull (log))
    {
        if (maxConcurrency == 0) {
            throw ContractError ("max concurrency of a worker pool must be at least 1");
        }
    }

    void WorkerPool::execute () {
        size_t nb = 0;
        WITH_LOCK (this-> _m) {
            nb = std::min ((size_t) this-> _maxConcurrency, this-> _queue.size ());
        }

        this-> _log-> debug ("starting " + std::to_string (nb) + " workers");
        for (size_t i = 0 ; i < nb ; i++) {
            this-> _threads.push_back (concurrency::spawn (this, &WorkerPool::work));
        }

        for (auto & it : this-> _threads) {
            concurrency::join (it);
        }

        this-> _threads.clear ();
    }

    void WorkerPool::work (concurrency::Thread) {
        node::NodeTarget target ("", "", utils::SshOptions ());
        while (this-> next (target)) {
            try {
                this-> _job (target);
            } catch (const std::exception & err) {
                this-> _log-> error ("[" + target.getId () + "] job failed : " + err.what ());
            } catch (...) {
                this-> _log-> error ("[" + target.getId () + "] job failed with an unknown error");
            }
        }
    }

    bool WorkerPool::next (node::NodeTarget & target) {
        bool found = false;
        WITH_LOCK (this-> _m) {
            if (!this-> _queue.empty ()) {
                target = this-> _queue.front ();
                this-> _queue.pop_front ();
                found = true;
            }
        }

        return found;
    }

}
