#include "response.hh"

namespace fleetcmd::connector {

    HostFailure HostFailure::from (const std::string & host, const HostError & err) {
        HostFailure f;
        f.host = host;
        f.kind = err.getKind ();
        f.cause = err.getCause ();
        f.step = err.getStep ();
        f.reason = err.what ();
        f.result.host = host;

        return f;
    }

    ResponseSet::ResponseSet () {}

    ResponseSet::ResponseSet (const ResponseSet & other) {
        WITH_LOCK (other._m) {
            this-> _successes = other._successes;
            this-> _failures = other._failures;
            this-> _recorded = other._recorded;
        }
    }

    ResponseSet & ResponseSet::operator= (const ResponseSet & other) {
        if (this == &other) return *this;

        std::vector <CommandResult> successes;
        std::vector <HostFailure> failures;
        std::set <std::string> recorded;
        WITH_LOCK (other._m) {
            successes = other._successes;
            failures = other._failures;
            recorded = other._recorded;
        }

        WITH_LOCK (this-> _m) {
            this-> _successes = std::move (successes);
            this-> _failures = std::move (failures);
            this-> _recorded = std::move (recorded);
        }

        return *this;
    }

    bool ResponseSet::addSuccess (const CommandResult & result) {
        WITH_LOCK (this-> _m) {
            if (!this-> _recorded.emplace (result.host).second) return false;
            this-> _successes.push_back (result);
        }

        return true;
    }

    bool ResponseSet::addFailure (const HostFailure & failure) {
        WITH_LOCK (this-> _m) {
            if (!this-> _recorded.emplace (failure.host).second) return false;
            this-> _failures.push_back (failure);
        }

        return true;
    }

    std::vector <CommandResult> ResponseSet::successes () const {
        std::vector <CommandResult> result;
        WITH_LOCK (this-> _m) {
            result = this-> _successes;
        }

        return result;
    }

    std::vector <HostFailure> ResponseSet::failures () const {
        std::vector <HostFailure> result;
        WITH_LOCK (this-> _m) {
            result = this-> _failures;
        }

        return result;
    }

    bool ResponseSet::ok () const {
        bool result = true;
        WITH_LOCK (this-> _m) {
            result = this-> _failures.empty ();
        }

        return result;
    }

    size_t ResponseSet::size () const {
        size_t result = 0;
        WITH_LOCK (this-> _m) {
            result = this-> _recorded.size ();
        }

        return result;
    }

    bool ResponseSet::findSuccess (const std::string & host, CommandResult & res) const {
        WITH_LOCK (this-> _m) {
            for (auto & it : this-> _successes) {
                if (it.host == host) {
                    res = it;
                    return true;
                }
            }
        }

        return false;
    }

    bool ResponseSet::findFailure (const std::string & host, HostFailure & res) const {
        WITH_LOCK (this-> _m) {
            for (auto & it : this-> _failures) {
                if (it.host == host) {
                    res = it;
                    return true;
                }
            }
        }

        return false;
    }

}
