#pragma once

#include <rd_utils/_.hh>
#include <cstdint>
#include <set>
#include <string>
#include <vector>

#include <fleetcmd/errors.hh>

namespace fleetcmd::connector {

    /**
     * The output of a command executed on a host
     */
    struct CommandResult {

        // The identity of the host
        std::string host;

        std::string out;

        std::string err;

        int32_t exitStatus = 0;

    };

    /**
     * The reason a host failed during a run
     */
    struct HostFailure {

        // The identity of the host
        std::string host;

        ErrorKind kind = ErrorKind::NONE;

        // For step failures, the kind of the underlying error
        ErrorKind cause = ErrorKind::NONE;

        // For step failures, the name of the failing step
        std::string step;

        std::string reason;

        // The output of the command for remote execution failures
        CommandResult result;

        /**
         * Build a failure from an error raised for a host
         */
        static HostFailure from (const std::string & host, const HostError & err);

    };

    /**
     * Outcomes of a multi host run, partitioned into successes and failures
     * The entries are kept in completion order
     * A host is recorded at most once, in one of the two partitions
     */
    class ResponseSet {
    private:

        std::vector <CommandResult> _successes;

        std::vector <HostFailure> _failures;

        // The hosts already recorded in one of the partitions
        std::set <std::string> _recorded;

        mutable rd_utils::concurrency::mutex _m;

    public:

        ResponseSet ();

        ResponseSet (const ResponseSet & other);

        ResponseSet & operator= (const ResponseSet & other);

        /**
         * Record the success of a host
         * @returns: false if the host was already recorded (nothing is changed)
         */
        bool addSuccess (const CommandResult & result);

        /**
         * Record the failure of a host
         * @returns: false if the host was already recorded (nothing is changed)
         */
        bool addFailure (const HostFailure & failure);

        /**
         * @returns: a copy of the successes in completion order
         */
        std::vector <CommandResult> successes () const;

        /**
         * @returns: a copy of the failures in completion order
         */
        std::vector <HostFailure> failures () const;

        /**
         * @returns: true iif there is no failure
         */
        bool ok () const;

        /**
         * @returns: the number of recorded hosts
         */
        size_t size () const;

        /**
         * @returns: true if host succeeded, and its result in res
         */
        bool findSuccess (const std::string & host, CommandResult & res) const;

        /**
         * @returns: true if host failed, and its failure in res
         */
        bool findFailure (const std::string & host, HostFailure & res) const;

    };

}
