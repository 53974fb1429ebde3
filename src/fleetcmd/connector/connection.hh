#pragma once

#include <rd_utils/_.hh>
#include <memory>
#include <string>

#include <fleetcmd/node/target.hh>
#include <fleetcmd/utils/logger.hh>
#include "deadline.hh"
#include "response.hh"
#include "transport.hh"

namespace fleetcmd::connector {

    // Shell prefix reading the sudo password from the first line of the standard input
    extern const std::string SUDO_VALIDATE;

    /**
     * A live session to exactly one target
     * The timeout of the target covers the handshake and every command executed on the connection
     * The transport is closed when the timeout expires, and when the connection is destroyed
     */
    class Connection {
    private:

        // The host of the connection
        node::NodeTarget _target;

        // The session to the host
        std::shared_ptr <Transport> _transport;

        // Receives the command lines and the exit statuses
        std::shared_ptr <utils::Logger> _log;

        // Started at the beginning of the handshake
        Deadline _deadline;

        bool _opened;

        bool _closed;

    public:

        /**
         * @params:
         *    - target: the host to reach
         *    - transport: a fresh transport, owned by the connection from now on
         *    - log: the logger (null logger if nullptr)
         */
        Connection (const node::NodeTarget & target, std::shared_ptr <Transport> transport, std::shared_ptr <utils::Logger> log = nullptr);

        Connection (const Connection &) = delete;
        void operator= (const Connection &) = delete;

        /**
         * Connect and authenticate, starts the timeout
         * @throws:
         *    - HostError (TARGET_UNREACHABLE) if the address of the target is unknown, no connection is attempted
         *    - HostError (CONNECT_ERROR, TIMEOUT) if the handshake failed, the connection is closed
         */
        void open ();

        /**
         * Execute a command (wrapped in sudo if the target requires it)
         * A nonzero exit status is not an error at this level
         * @params:
         *    - cmd: the command line
         *    - input: the standard input of the command
         * @throws: HostError (TIMEOUT, CONNECT_ERROR), the connection is closed
         */
        CommandResult execute (const std::string & cmd, const std::string & input = "");

        /**
         * Write content to a remote file, creating its parent directory
         * @params:
         *    - content: the content of the file
         *    - path: the absolute path of the remote file
         *    - mode: the permissions of the file
         * @throws: HostError (REMOTE_EXECUTION_FAILURE) if the file could not be written, or as execute
         */
        void upload (const std::string & content, const std::string & path, uint32_t mode = 0644);

        /**
         * Close the transport, does nothing if already closed
         */
        void close ();

        bool isOpened () const;

        const node::NodeTarget & getTarget () const;

        ~Connection ();

    private:

        /**
         * @returns: the time left before the timeout in seconds
         * @throws: HostError (TIMEOUT) if none is left, the connection is closed
         */
        float timeLeft ();

        /**
         * Wrap the command in sudo if needed
         * With a password, the first line of the standard input is read by the wrapper to validate sudo,
         * the command itself runs with sudo -n and only receives the rest of the input
         * @params:
         *    - cmd: the command to run
         *    - input: the standard input of the command, the password line is prepended to it
         * @returns: the command line to execute
         */
        std::string elevate (const std::string & cmd, std::string & input) const;

    };

    /**
     * @returns: str quoted for a posix shell
     */
    std::string shellQuote (const std::string & str);

}
