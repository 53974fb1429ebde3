#include "runner.hh"
#include "pool.hh"
#include <fleetcmd/errors.hh>

#include <set>

namespace fleetcmd::connector {

    Session::Session (Connection & conn)
        : _conn (conn)
    {}

    CommandResult Session::run (const std::string & cmd, const std::string & input) {
        return this-> _conn.execute (cmd, input);
    }

    void Session::upload (const std::string & content, const std::string & path, uint32_t mode) {
        this-> _conn.upload (content, path, mode);
    }

    const node::NodeTarget & Session::getTarget () const {
        return this-> _conn.getTarget ();
    }

    /*!
     * ====================================================================================================
     * ====================================================================================================
     * ===================================           RUNNER            ====================================
     * ====================================================================================================
     * ====================================================================================================
     */

    CommandRunner::CommandRunner (std::shared_ptr <TransportFactory> factory, const utils::RunnerOptions & opts, std::shared_ptr <utils::Logger> log)
        : _factory (factory)
        , _opts (opts)
        , _log (utils::orNull (log))
    {
        if (this-> _factory == nullptr) {
            throw ContractError ("a command runner needs a transport factory");
        }

        if (this-> _opts.maxConcurrency == 0) {
            throw ContractError ("max concurrency must be at least 1");
        }
    }

    ResponseSet CommandRunner::run (const std::vector <node::NodeTarget> & targets, const std::string & command) {
        return this-> run (targets, [command] (Session & s) {
            return s.run (command);
        });
    }

    ResponseSet CommandRunner::run (const std::vector <node::NodeTarget> & targets, const SessionBlock & block) {
        if (!block) {
            throw ContractError ("no block given to the interactive run");
        }

        ResponseSet result;
        if (targets.empty ()) return result;

        for (auto & it : targets) {
            it.getSshOptions ().validate ();
        }

        auto unique = this-> deduplicate (targets);
        this-> _log-> info ("running on " + std::to_string (unique.size ()) + " host(s), at most " + std::to_string (this-> _opts.maxConcurrency) + " at a time");

        WorkerPool pool (unique, [this, &block, &result] (const node::NodeTarget & target) {
            this-> runOnHost (target, block, result);
        }, this-> _opts.maxConcurrency, this-> _log);

        pool.execute ();

        return result;
    }

    void CommandRunner::runOnHost (const node::NodeTarget & target, const SessionBlock & block, ResponseSet & result) {
        try {
            Connection conn (target, this-> _factory-> create (), this-> _log);
            conn.open ();

            Session session (conn);
            auto res = block (session);
            res.host = target.getId ();

            if (res.exitStatus != 0) {
                HostFailure f = HostFailure::from (target.getId (), HostError (ErrorKind::REMOTE_EXECUTION_FAILURE, "exit status " + std::to_string (res.exitStatus) + " : " + res.err));
                f.result = res;

                result.addFailure (f);
            } else {
                result.addSuccess (res);
            }
        } catch (const HostError & err) {
            this-> _log-> error ("[" + target.getId () + "] " + toString (err.getKind ()) + " : " + err.what ());
            result.addFailure (HostFailure::from (target.getId (), err));
        } catch (const std::exception & err) {
            this-> _log-> error ("[" + target.getId () + "] block failed : " + err.what ());
            result.addFailure (HostFailure::from (target.getId (), HostError (ErrorKind::REMOTE_EXECUTION_FAILURE, err.what ())));
        } catch (...) {
            this-> _log-> error ("[" + target.getId () + "] block failed with an unknown error");
            result.addFailure (HostFailure::from (target.getId (), HostError (ErrorKind::REMOTE_EXECUTION_FAILURE, "unknown error")));
        }
    }

    std::vector <node::NodeTarget> CommandRunner::deduplicate (const std::vector <node::NodeTarget> & targets) {
        std::vector <node::NodeTarget> result;
        std::set <std::string> seen;
        for (auto & it : targets) {
            if (seen.find (it.getId ()) != seen.end ()) {
                this-> _log-> warn ("ignoring duplicate target " + it.getId () + " (" + it.getName () + ")");
                continue;
            }

            seen.emplace (it.getId ());
            result.push_back (it);
        }

        return result;
    }

    const utils::RunnerOptions & CommandRunner::getOptions () const {
        return this-> _opts;
    }

    CommandRunner::~CommandRunner () {}

}
