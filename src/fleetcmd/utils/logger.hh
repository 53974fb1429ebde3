#pragma once

#include <memory>
#include <string>

namespace fleetcmd::utils {

    /**
     * Logging collaborator injected into the engine
     * The engine never changes its control flow depending on what is logged
     */
    class Logger {
    public:

        virtual void debug (const std::string & msg) = 0;

        virtual void info (const std::string & msg) = 0;

        virtual void warn (const std::string & msg) = 0;

        virtual void error (const std::string & msg) = 0;

        virtual ~Logger ();

    };

    /**
     * Logger discarding everything, used when no logger is given to the engine
     */
    class NullLogger : public Logger {
    public:

        void debug (const std::string &) override;
        void info (const std::string &) override;
        void warn (const std::string &) override;
        void error (const std::string &) override;

    };

    /**
     * Logger forwarding to the rd_utils logging system
     */
    class SystemLogger : public Logger {
    public:

        void debug (const std::string & msg) override;
        void info (const std::string & msg) override;
        void warn (const std::string & msg) override;
        void error (const std::string & msg) override;

    };

    /**
     * @returns: log if not null, a NullLogger otherwise
     */
    std::shared_ptr <Logger> orNull (std::shared_ptr <Logger> log);

}
