#pragma once

#include <stdexcept>
#include <string>

namespace fleetcmd {

    /**
     * Classification of the failure of a single host during a run
     */
    enum class ErrorKind {
        NONE = 0,

        // The address resolution of the node gave nothing usable
        TARGET_UNREACHABLE,

        // The transport or the authentication handshake failed
        CONNECT_ERROR,

        // The handshake or the execution exceeded the configured timeout
        TIMEOUT,

        // The remote operation completed with a nonzero exit status
        REMOTE_EXECUTION_FAILURE,

        // A named bootstrap step failed (the cause is one of the above)
        STEP_FAILURE
    };

    /**
     * @returns: the name of the kind of error (e.g. "Timeout")
     */
    std::string toString (ErrorKind kind);

    /**
     * Base class of every error thrown by fleetcmd
     */
    class FleetError : public std::runtime_error {
    public:

        explicit FleetError (const std::string & msg);

    };

    /**
     * Raised when a caller breaks a precondition of the engine (missing block, missing credentials, ...)
     * This error is never recovered at the host boundary, it aborts the run before any connection
     */
    class ContractError : public FleetError {
    public:

        explicit ContractError (const std::string & msg);

    };

    /**
     * Raised when a configuration file or a node record is malformed
     */
    class ConfigError : public FleetError {
    public:

        explicit ConfigError (const std::string & msg);

    };

    /**
     * An error bound to a single host
     * Caught at the per host boundary of a run and stored in the failure partition of the response set
     */
    class HostError : public FleetError {
    private:

        // The classification of the error
        ErrorKind _kind;

        // For step failures, the classification of the underlying error
        ErrorKind _cause;

        // For step failures, the name of the step that failed
        std::string _step;

    public:

        /**
         * @params:
         *    - kind: the classification of the error
         *    - msg: the reason
         */
        HostError (ErrorKind kind, const std::string & msg);

        /**
         * Wrap an error into a step failure
         * @params:
         *    - step: the name of the failing step
         *    - cause: the error raised by the step
         */
        static HostError step (const std::string & step, const HostError & cause);

        ErrorKind getKind () const;

        ErrorKind getCause () const;

        const std::string & getStep () const;

    };

}
