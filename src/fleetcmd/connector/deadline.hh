#pragma once

#include <rd_utils/_.hh>
#include <string>

namespace fleetcmd::connector {

    /**
     * A time budget in seconds, started at construction or on restart
     */
    class Deadline {
    private:

        rd_utils::concurrency::timer _timer;

        float _budget;

    public:

        Deadline (float budget);

        /**
         * Start the budget again from now
         */
        void restart ();

        /**
         * @returns: the seconds left, negative or zero once expired
         */
        float left ();

        bool expired ();

        /**
         * @params:
         *    - host: the host named in the error
         * @returns: the seconds left
         * @throws: HostError (TIMEOUT) if the budget is expired
         */
        float remaining (const std::string & host);

        float getBudget () const;

        /**
         * Split a duration in seconds into whole seconds and microseconds (at least 1ms in total)
         */
        static void split (float seconds, long & sec, long & usec);

    };

}
