#pragma once

#include <rd_utils/_.hh>
#include <memory>
#include <string>
#include <vector>

#include <fleetcmd/connector/response.hh>
#include <fleetcmd/connector/transport.hh>
#include <fleetcmd/node/directory.hh>
#include <fleetcmd/node/target.hh>
#include <fleetcmd/utils/logger.hh>
#include <fleetcmd/utils/options.hh>

namespace fleetcmd::front {

    enum class Action {
        NONE = 0,
        RUN,
        BOOTSTRAP,
        AGENT
    };

    /**
     * The command line front end
     * Reads the host file, selects the targets, runs the action and reports the outcome of each host
     */
    class Command {
    private:

        // The path of the configuration file
        std::string _hostFile;

        // The parsed configuration file
        std::shared_ptr <rd_utils::utils::config::ConfigNode> _cfg;

        Action _action = Action::NONE;

        // The command line of the run action
        std::string _command;

        // Run chef-solo instead of chef-client for the agent action
        bool _solo = false;

        // The names of the nodes to select in the directory (all if empty)
        std::vector <std::string> _nodeNames;

        // Addresses given on the command line
        std::vector <std::string> _hosts;

        utils::SshOptions _ssh;

        utils::RunnerOptions _runner;

        utils::BootstrapOptions _bootstrap;

        // The node directory if configured
        std::shared_ptr <node::NodeDirectory> _directory;

        // The addresses listed in the configuration
        std::vector <std::string> _cfgHosts;

        std::shared_ptr <utils::Logger> _log;

        // Creates the transports, ssh unless replaced
        std::shared_ptr <connector::TransportFactory> _factory;

    public:

        Command ();

        /**
         * Parse the command line and the configuration file
         * @throws:
         *    - ConfigError if the configuration is malformed
         *    - ContractError if the ssh credentials are incomplete
         */
        void configure (int argc, char ** argv);

        /**
         * Run the configured action
         * @returns: the exit status of the program, 0 if every host succeeded, 1 otherwise
         */
        int execute ();

        /**
         * Change the transports (default is ssh)
         */
        void setTransportFactory (std::shared_ptr <connector::TransportFactory> factory);

        /**
         * @returns: the targets of the action, directory nodes first then raw addresses
         */
        std::vector <node::NodeTarget> targets ();

        Action getAction () const;

    private:

        void parseCmdOptions (int argc, char ** argv);

        /**
         * Read the options of the configuration file
         * @params:
         *    - cwd: the directory of the configuration file, relative paths are resolved from there
         */
        void configureOptions (const std::string & cwd, const rd_utils::utils::config::ConfigNode & cfg);

        void configureNodes (const std::string & cwd, const rd_utils::utils::config::ConfigNode & cfg);

        /**
         * Print the outcome of every host
         * @returns: the exit status
         */
        int report (const connector::ResponseSet & result) const;

    };

}
