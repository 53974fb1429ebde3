#include "connection.hh"
#include <fleetcmd/errors.hh>
#include <sstream>

namespace fleetcmd::connector {

    // Consumes the password line of the standard input and caches the sudo credentials
    const std::string SUDO_VALIDATE = "{ IFS= read -r _p; printf '%s\\n' \"$_p\" | sudo -S -p '' -v; }";

    std::string shellQuote (const std::string & str) {
        std::string result = "'";
        for (auto c : str) {
            if (c == '\'') result += "'\\''";
            else result += c;
        }

        return result + "'";
    }

    Connection::Connection (const node::NodeTarget & target, std::shared_ptr <Transport> transport, std::shared_ptr <utils::Logger> log)
        : _target (target)
        , _transport (transport)
        , _log (utils::orNull (log))
        , _deadline (target.getTimeout ())
        , _opened (false)
        , _closed (false)
    {}

    /*!
     * ====================================================================================================
     * ====================================================================================================
     * ===================================          HANDSHAKE          ====================================
     * ====================================================================================================
     * ====================================================================================================
     */

    void Connection::open () {
        if (this-> _opened) return;
        if (this-> _closed) {
            throw HostError (ErrorKind::CONNECT_ERROR, "connection to " + this-> _target.getId () + " was already closed");
        }

        this-> _deadline.restart ();
        if (!this-> _target.isResolved ()) {
            this-> close ();
            throw HostError (ErrorKind::TARGET_UNREACHABLE, "no usable address for node " + this-> _target.getName ());
        }

        this-> _log-> debug ("[" + this-> _target.getId () + "] connecting as " + this-> _target.getUser ());
        try {
            this-> _transport-> connect (this-> _target, this-> timeLeft ());
        } catch (const HostError & err) {
            this-> _log-> error ("[" + this-> _target.getId () + "] " + err.what ());
            this-> close ();
            throw;
        }

        this-> _opened = true;
    }

    /*!
     * ====================================================================================================
     * ====================================================================================================
     * ===================================          EXECUTION          ====================================
     * ====================================================================================================
     * ====================================================================================================
     */

    CommandResult Connection::execute (const std::string & cmd, const std::string & in) {
        if (!this-> _opened) {
            throw HostError (ErrorKind::CONNECT_ERROR, "connection to " + this-> _target.getId () + " is not opened");
        }

        std::string input = in;
        auto line = this-> elevate (cmd, input);

        this-> _log-> info ("[" + this-> _target.getId () + "] running : " + cmd);

        ProcessOutput out;
        try {
            out = this-> _transport-> exec (line, input, this-> timeLeft ());
        } catch (const HostError & err) {
            this-> _log-> error ("[" + this-> _target.getId () + "] " + err.what ());
            this-> close ();
            throw;
        }

        this-> _log-> info ("[" + this-> _target.getId () + "] exit status : " + std::to_string (out.exitStatus));

        CommandResult result;
        result.host = this-> _target.getId ();
        result.out = out.out;
        result.err = out.err;
        result.exitStatus = out.exitStatus;

        return result;
    }

    void Connection::upload (const std::string & content, const std::string & path, uint32_t mode) {
        std::string dir = "/";
        auto index = path.rfind ('/');
        if (index != std::string::npos && index != 0) {
            dir = path.substr (0, index);
        }

        std::stringstream ss;
        ss << std::oct << mode;

        auto cmd = "mkdir -p " + shellQuote (dir)
            + " && cat > " + shellQuote (path)
            + " && chmod " + ss.str () + " " + shellQuote (path);

        auto result = this-> execute (cmd, content);
        if (result.exitStatus != 0) {
            throw HostError (ErrorKind::REMOTE_EXECUTION_FAILURE, "failed to write " + path + " on " + this-> _target.getId ()
                             + " (exit status " + std::to_string (result.exitStatus) + ") : " + result.err);
        }
    }

    std::string Connection::elevate (const std::string & cmd, std::string & input) const {
        if (!this-> _target.isSudo ()) return cmd;

        if (this-> _target.usesKeys ()) {
            return "sudo -n sh -c " + shellQuote (cmd);
        }

        input = this-> _target.getPassword () + "\n" + input;
        return SUDO_VALIDATE + " && sudo -n sh -c " + shellQuote (cmd);
    }

    float Connection::timeLeft () {
        try {
            return this-> _deadline.remaining (this-> _target.getId ());
        } catch (const HostError &) {
            this-> close ();
            throw;
        }
    }

    /*!
     * ====================================================================================================
     * ====================================================================================================
     * ===================================          DISPOSING          ====================================
     * ====================================================================================================
     * ====================================================================================================
     */

    void Connection::close () {
        if (this-> _closed) return;

        this-> _transport-> disconnect ();
        this-> _opened = false;
        this-> _closed = true;
        this-> _log-> debug ("[" + this-> _target.getId () + "] closed");
    }

    bool Connection::isOpened () const {
        return this-> _opened;
    }

    const node::NodeTarget & Connection::getTarget () const {
        return this-> _target;
    }

    Connection::~Connection () {
        this-> close ();
    }

}
