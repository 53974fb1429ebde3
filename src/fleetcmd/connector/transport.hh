#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include <fleetcmd/node/target.hh>

namespace fleetcmd::connector {

    /**
     * The output of a process run through a transport
     */
    struct ProcessOutput {

        std::string out;

        std::string err;

        int32_t exitStatus = 0;

    };

    /**
     * A session to one remote host
     * A transport is used by a single connection and is never shared between threads
     */
    class Transport {
    public:

        /**
         * Open the session and authenticate
         * @params:
         *    - target: the host to reach and its credentials
         *    - timeout: the time left for the handshake in seconds
         * @throws:
         *    - HostError (CONNECT_ERROR) if the connection or the authentication failed
         *    - HostError (TIMEOUT) if the handshake took longer than timeout
         */
        virtual void connect (const node::NodeTarget & target, float timeout) = 0;

        /**
         * Execute a command on the remote host
         * @params:
         *    - cmd: the command line
         *    - input: the content written to the standard input of the command
         *    - timeout: the time left for the execution in seconds
         * @throws:
         *    - HostError (TIMEOUT) if the command did not complete in time
         *    - HostError (CONNECT_ERROR) if the session broke
         */
        virtual ProcessOutput exec (const std::string & cmd, const std::string & input, float timeout) = 0;

        /**
         * Close the session, does nothing if already closed
         */
        virtual void disconnect () = 0;

        virtual ~Transport ();

    };

    /**
     * Creates a fresh transport for every connection
     */
    class TransportFactory {
    public:

        virtual std::shared_ptr <Transport> create () = 0;

        virtual ~TransportFactory ();

    };

}
