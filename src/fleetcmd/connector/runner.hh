#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <fleetcmd/node/target.hh>
#include <fleetcmd/utils/logger.hh>
#include <fleetcmd/utils/options.hh>
#include "connection.hh"
#include "response.hh"
#include "transport.hh"

namespace fleetcmd::connector {

    /**
     * Handle given to an interactive block, forwards to the connection of one host
     */
    class Session {
    private:

        Connection & _conn;

    public:

        Session (Connection & conn);

        Session (const Session &) = delete;
        void operator= (const Session &) = delete;

        /**
         * Run a command on the host
         * @returns: the output and exit status of the command
         */
        CommandResult run (const std::string & cmd, const std::string & input = "");

        /**
         * Write a remote file
         */
        void upload (const std::string & content, const std::string & path, uint32_t mode = 0644);

        const node::NodeTarget & getTarget () const;

    };

    typedef std::function <CommandResult (Session &)> SessionBlock;

    /**
     * Runs commands on a set of targets in parallel
     * Each target is tried once, its outcome is recorded either as a success or as a failure
     */
    class CommandRunner {
    protected:

        // Creates one transport per connection
        std::shared_ptr <TransportFactory> _factory;

        utils::RunnerOptions _opts;

        std::shared_ptr <utils::Logger> _log;

    public:

        /**
         * @params:
         *    - factory: the transports used to reach the hosts
         *    - opts: the concurrency options
         *    - log: the logger (null logger if nullptr)
         */
        CommandRunner (std::shared_ptr <TransportFactory> factory, const utils::RunnerOptions & opts = utils::RunnerOptions (), std::shared_ptr <utils::Logger> log = nullptr);

        /**
         * Run a single command on every target
         * @returns: the outcome of every target, a nonzero exit status is a failure
         * @throws: ContractError if the credentials of a target are incomplete
         */
        ResponseSet run (const std::vector <node::NodeTarget> & targets, const std::string & command);

        /**
         * Open a session on every target and call the block with it
         * @params:
         *    - targets: the hosts
         *    - block: called once per host from the worker owning its connection, returns the outcome of the host
         * @returns: the outcome of every target
         * @throws: ContractError if the block is empty or the credentials of a target are incomplete, before any connection
         */
        ResponseSet run (const std::vector <node::NodeTarget> & targets, const SessionBlock & block);

        const utils::RunnerOptions & getOptions () const;

        virtual ~CommandRunner ();

    protected:

        /**
         * Open the connection to the target, run the block, and record the outcome
         */
        void runOnHost (const node::NodeTarget & target, const SessionBlock & block, ResponseSet & result);

        /**
         * @returns: the targets with duplicate identities removed, first occurence kept
         */
        std::vector <node::NodeTarget> deduplicate (const std::vector <node::NodeTarget> & targets);

    };

}
