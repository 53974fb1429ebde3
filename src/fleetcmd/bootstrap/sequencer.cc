#include "sequencer.hh"
#include <fleetcmd/errors.hh>

namespace fleetcmd::bootstrap {

    BootstrapSequencer::BootstrapSequencer (const BootstrapContext & context, std::shared_ptr <connector::TransportFactory> factory, const utils::RunnerOptions & opts, std::shared_ptr <utils::Logger> log)
        : connector::CommandRunner (factory, opts, log)
        , _context (context)
    {}

    connector::ResponseSet BootstrapSequencer::run (const std::vector <node::NodeTarget> & targets) {
        auto steps = this-> _context.getSteps ();
        auto log = this-> _log;

        return connector::CommandRunner::run (targets, [steps, log] (connector::Session & s) {
            for (auto & step : steps) {
                log-> info ("[" + s.getTarget ().getId () + "] step " + step.name);
                try {
                    step.action (s);
                } catch (const HostError & err) {
                    throw HostError::step (step.name, err);
                }
            }

            connector::CommandResult result;
            result.host = s.getTarget ().getId ();
            result.out = "bootstrapped";

            return result;
        });
    }

    const BootstrapContext & BootstrapSequencer::getContext () const {
        return this-> _context;
    }

}
