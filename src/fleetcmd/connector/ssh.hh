#pragma once

#include <libssh/libssh.h>
#include <memory>

#include <fleetcmd/errors.hh>
#include <fleetcmd/utils/logger.hh>
#include "deadline.hh"
#include "transport.hh"

namespace fleetcmd::connector {

    /**
     * Transport opening an ssh session with libssh
     * Host keys are not verified
     * The libssh timeout is narrowed to the time left before every blocking call
     */
    class SshTransport : public Transport {
    private:

        // The libssh session, nullptr when disconnected
        ssh_session _session;

        // The address of the remote host (for error messages)
        std::string _host;

        std::shared_ptr <utils::Logger> _log;

    public:

        SshTransport (std::shared_ptr <utils::Logger> log = nullptr);

        SshTransport (const SshTransport &) = delete;
        void operator= (const SshTransport &) = delete;

        void connect (const node::NodeTarget & target, float timeout) override;

        ProcessOutput exec (const std::string & cmd, const std::string & input, float timeout) override;

        void disconnect () override;

        ~SshTransport ();

    private:

        /**
         * Authenticate with the keys if there are some, with the password otherwise
         * @throws:
         *    - HostError (TIMEOUT) if the deadline expired during the authentication
         *    - HostError (CONNECT_ERROR) if the authentication is refused
         */
        void authenticate (const node::NodeTarget & target, Deadline & deadline);

        /**
         * Set the libssh timeout to the time left
         * @throws: HostError (TIMEOUT) if the deadline is expired
         */
        void narrow (Deadline & deadline);

        /**
         * @returns: TIMEOUT if the deadline expired, CONNECT_ERROR otherwise
         */
        ErrorKind classify (Deadline & deadline);

        /**
         * @returns: the last error of the session
         */
        std::string lastError () const;

    };

    class SshTransportFactory : public TransportFactory {
    private:

        std::shared_ptr <utils::Logger> _log;

    public:

        SshTransportFactory (std::shared_ptr <utils::Logger> log = nullptr);

        std::shared_ptr <Transport> create () override;

    };

}
