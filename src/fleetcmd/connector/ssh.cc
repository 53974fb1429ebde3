#include "ssh.hh"
#include <fleetcmd/errors.hh>

#include <algorithm>
#include <cstdlib>


namespace fleetcmd::connector {

    namespace {

        /**
         * Channel closed and freed when leaving the scope
         */
        class ScopedChannel {
        public:

            ssh_channel ch;

            ScopedChannel (ssh_session session)
                : ch (ssh_channel_new (session))
            {}

            ScopedChannel (const ScopedChannel &) = delete;
            void operator= (const ScopedChannel &) = delete;

            ~ScopedChannel () {
                if (this-> ch != nullptr) {
                    ssh_channel_close (this-> ch);
                    ssh_channel_free (this-> ch);
                }
            }
        };

        std::string expandHome (const std::string & path) {
            if (path.size () == 0 || path [0] != '~') return path;

            const char * home = ::getenv ("HOME");
            if (home == nullptr) return path;

            return std::string (home) + path.substr (1);
        }

        /**
         * Append everything readable without blocking on a stream of the channel
         */
        void drain (ssh_channel ch, int isStderr, std::string & out) {
            char buffer [4096];
            for (int n ; (n = ssh_channel_read_nonblocking (ch, buffer, sizeof (buffer), isStderr)) > 0 ;) {
                out.append (buffer, n);
            }
        }

    }

    SshTransport::SshTransport (std::shared_ptr <utils::Logger> log)
        : _session (nullptr)
        , _log (utils::orNull (log))
    {}

    /*!
     * ====================================================================================================
     * ====================================================================================================
     * ===================================          HANDSHAKE          ====================================
     * ====================================================================================================
     * ====================================================================================================
     */

    void SshTransport::connect (const node::NodeTarget & target, float timeout) {
        this-> disconnect ();
        this-> _host = target.getAddress ();

        this-> _session = ssh_new ();
        if (this-> _session == nullptr) {
            throw HostError (ErrorKind::CONNECT_ERROR, "cannot allocate an ssh session for " + this-> _host);
        }

        Deadline deadline (timeout);
        unsigned int port = target.getPort ();
        int verbosity = SSH_LOG_NOLOG;

        ssh_options_set (this-> _session, SSH_OPTIONS_HOST, this-> _host.c_str ());
        ssh_options_set (this-> _session, SSH_OPTIONS_USER, target.getUser ().c_str ());
        ssh_options_set (this-> _session, SSH_OPTIONS_PORT, &port);
        ssh_options_set (this-> _session, SSH_OPTIONS_LOG_VERBOSITY, &verbosity);

        try {
            this-> narrow (deadline);
            if (ssh_connect (this-> _session) != SSH_OK) {
                throw HostError (this-> classify (deadline), "failed to connect to " + this-> _host + " : " + this-> lastError ());
            }

            this-> authenticate (target, deadline);
            deadline.remaining (this-> _host);
        } catch (const HostError &) {
            this-> disconnect ();
            throw;
        }

        this-> _log-> debug ("[" + this-> _host + "] connected as " + target.getUser () + " (took : " + std::to_string (timeout - deadline.left ()) + "s)");
    }

    void SshTransport::authenticate (const node::NodeTarget & target, Deadline & deadline) {
        if (target.usesKeys ()) {
            for (auto & path : target.getKeys ()) {
                ssh_key key = nullptr;
                if (ssh_pki_import_privkey_file (expandHome (path).c_str (), nullptr, nullptr, nullptr, &key) != SSH_OK) {
                    this-> _log-> warn ("cannot read private key : " + path);
                    continue;
                }

                this-> narrow (deadline);
                auto rc = ssh_userauth_publickey (this-> _session, nullptr, key);
                ssh_key_free (key);

                if (rc == SSH_AUTH_SUCCESS) return;
                if (rc == SSH_AUTH_ERROR) {
                    throw HostError (this-> classify (deadline), "authentication with keys failed on " + this-> _host + " : " + this-> lastError ());
                }
            }

            throw HostError (this-> classify (deadline), "authentication with keys refused by " + this-> _host + " for " + target.getUser ());
        }

        this-> narrow (deadline);
        if (ssh_userauth_password (this-> _session, nullptr, target.getPassword ().c_str ()) != SSH_AUTH_SUCCESS) {
            throw HostError (this-> classify (deadline), "authentication with password refused by " + this-> _host + " for " + target.getUser () + " : " + this-> lastError ());
        }
    }

    /*!
     * ====================================================================================================
     * ====================================================================================================
     * ===================================          EXECUTION          ====================================
     * ====================================================================================================
     * ====================================================================================================
     */

    ProcessOutput SshTransport::exec (const std::string & cmd, const std::string & input, float timeout) {
        if (this-> _session == nullptr) {
            throw HostError (ErrorKind::CONNECT_ERROR, "session is not opened");
        }

        Deadline deadline (timeout);
        this-> narrow (deadline);

        ScopedChannel channel (this-> _session);
        if (channel.ch == nullptr || ssh_channel_open_session (channel.ch) != SSH_OK) {
            throw HostError (this-> classify (deadline), "cannot open a channel on " + this-> _host + " : " + this-> lastError ());
        }

        this-> narrow (deadline);
        if (ssh_channel_request_exec (channel.ch, cmd.c_str ()) != SSH_OK) {
            throw HostError (this-> classify (deadline), "cannot execute on " + this-> _host + " : " + this-> lastError ());
        }

        size_t written = 0;
        while (written < input.size ()) {
            this-> narrow (deadline);
            auto n = ssh_channel_write (channel.ch, input.data () + written, input.size () - written);
            if (n == SSH_ERROR) {
                throw HostError (this-> classify (deadline), "cannot write to " + this-> _host + " : " + this-> lastError ());
            }

            written += n;
        }

        this-> narrow (deadline);
        ssh_channel_send_eof (channel.ch);

        ProcessOutput result;
        char buffer [4096];
        while (!ssh_channel_is_eof (channel.ch)) {
            float left = deadline.remaining (this-> _host);

            int slice = std::max (1, std::min (100, (int) (left * 1000)));
            auto n = ssh_channel_read_timeout (channel.ch, buffer, sizeof (buffer), 0, slice);
            if (n == SSH_ERROR) {
                throw HostError (this-> classify (deadline), "cannot read from " + this-> _host + " : " + this-> lastError ());
            }

            if (n > 0) result.out.append (buffer, n);
            drain (channel.ch, 1, result.err);
        }

        drain (channel.ch, 0, result.out);
        drain (channel.ch, 1, result.err);

        this-> narrow (deadline);
        result.exitStatus = ssh_channel_get_exit_status (channel.ch);
        return result;
    }

    void SshTransport::narrow (Deadline & deadline) {
        long sec = 0, usec = 0;
        Deadline::split (deadline.remaining (this-> _host), sec, usec);

        ssh_options_set (this-> _session, SSH_OPTIONS_TIMEOUT, &sec);
        ssh_options_set (this-> _session, SSH_OPTIONS_TIMEOUT_USEC, &usec);
    }

    ErrorKind SshTransport::classify (Deadline & deadline) {
        return deadline.expired () ? ErrorKind::TIMEOUT : ErrorKind::CONNECT_ERROR;
    }

    /*!
     * ====================================================================================================
     * ====================================================================================================
     * ===================================          DISPOSING          ====================================
     * ====================================================================================================
     * ====================================================================================================
     */

    void SshTransport::disconnect () {
        if (this-> _session != nullptr) {
            ssh_disconnect (this-> _session);
            ssh_free (this-> _session);
            this-> _session = nullptr;
        }
    }

    std::string SshTransport::lastError () const {
        if (this-> _session == nullptr) return "no session";
        return ssh_get_error (this-> _session);
    }

    SshTransport::~SshTransport () {
        this-> disconnect ();
    }

    SshTransportFactory::SshTransportFactory (std::shared_ptr <utils::Logger> log)
        : _log (log)
    {}

    std::shared_ptr <Transport> SshTransportFactory::create () {
        return std::make_shared <SshTransport> (this-> _log);
    }

}
