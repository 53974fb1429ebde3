#include "agent.hh"

namespace fleetcmd::bootstrap {

    Agent::Agent (connector::CommandRunner & runner)
        : _runner (runner)
    {}

    connector::ResponseSet Agent::chefClient (const std::vector <node::NodeTarget> & targets) {
        return this-> _runner.run (targets, "chef-client");
    }

    connector::ResponseSet Agent::chefSolo (const std::vector <node::NodeTarget> & targets) {
        return this-> _runner.run (targets, "chef-solo");
    }

}
