#pragma once

#include <fleetcmd/connector/runner.hh>

namespace fleetcmd::bootstrap {

    /**
     * Runs the configuration agent on already bootstrapped nodes
     */
    class Agent {
    private:

        connector::CommandRunner & _runner;

    public:

        Agent (connector::CommandRunner & runner);

        /**
         * Run chef-client on every target
         */
        connector::ResponseSet chefClient (const std::vector <node::NodeTarget> & targets);

        /**
         * Run chef-solo on every target
         */
        connector::ResponseSet chefSolo (const std::vector <node::NodeTarget> & targets);

    };

}
