#pragma once

#include <fleetcmd/connector/runner.hh>
#include "context.hh"

namespace fleetcmd::bootstrap {

    /**
     * Runs the bootstrap steps on every target, hosts in parallel, steps in sequence
     * The first failing step stops the bootstrap of its host, the failure carries the name of the step
     */
    class BootstrapSequencer : public connector::CommandRunner {
    private:

        BootstrapContext _context;

    public:

        BootstrapSequencer (const BootstrapContext & context, std::shared_ptr <connector::TransportFactory> factory, const utils::RunnerOptions & opts = utils::RunnerOptions (), std::shared_ptr <utils::Logger> log = nullptr);

        using connector::CommandRunner::run;

        /**
         * Bootstrap every target
         * @returns: the outcome of each target, a failed target has the kind STEP_FAILURE
         */
        connector::ResponseSet run (const std::vector <node::NodeTarget> & targets);

        const BootstrapContext & getContext () const;

    };

}
