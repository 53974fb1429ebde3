#include "errors.hh"

namespace fleetcmd {

    std::string toString (ErrorKind kind) {
        switch (kind) {
        case ErrorKind::NONE : return "None";
        case ErrorKind::TARGET_UNREACHABLE : return "TargetUnreachable";
        case ErrorKind::CONNECT_ERROR : return "ConnectError";
        case ErrorKind::TIMEOUT : return "Timeout";
        case ErrorKind::REMOTE_EXECUTION_FAILURE : return "RemoteExecutionFailure";
        case ErrorKind::STEP_FAILURE : return "StepFailure";
        }

        return "Unknown";
    }

    FleetError::FleetError (const std::string & msg)
        : std::runtime_error (msg)
    {}

    ContractError::ContractError (const std::string & msg)
        : FleetError (msg)
    {}

    ConfigError::ConfigError (const std::string & msg)
        : FleetError (msg)
    {}

    HostError::HostError (ErrorKind kind, const std::string & msg)
        : FleetError (msg)
        , _kind (kind)
        , _cause (ErrorKind::NONE)
    {}

    HostError HostError::step (const std::string & step, const HostError & cause) {
        HostError err (ErrorKind::STEP_FAILURE, "step '" + step + "' failed : " + cause.what ());
        err._step = step;
        err._cause = cause.getKind ();

        return err;
    }

    ErrorKind HostError::getKind () const {
        return this-> _kind;
    }

    ErrorKind HostError::getCause () const {
        return this-> _cause;
    }

    const std::string & HostError::getStep () const {
        return this-> _step;
    }

}
