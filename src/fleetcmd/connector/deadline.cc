#include "deadline.hh"
#include <fleetcmd/errors.hh>

namespace fleetcmd::connector {

    Deadline::Deadline (float budget)
        : _budget (budget)
    {}

    void Deadline::restart () {
        this-> _timer.reset ();
    }

    float Deadline::left () {
        return this-> _budget - this-> _timer.time_since_start ();
    }

    bool Deadline::expired () {
        return this-> left () <= 0;
    }

    float Deadline::remaining (const std::string & host) {
        float result = this-> left ();
        if (result <= 0) {
            throw HostError (ErrorKind::TIMEOUT, "timeout of " + std::to_string (this-> _budget) + "s exceeded on " + host);
        }

        return result;
    }

    float Deadline::getBudget () const {
        return this-> _budget;
    }

    void Deadline::split (float seconds, long & sec, long & usec) {
        if (seconds < 0.001) seconds = 0.001;

        sec = (long) seconds;
        usec = (long) ((seconds - sec) * 1000000);
        if (sec == 0 && usec < 1000) usec = 1000;
    }

}
