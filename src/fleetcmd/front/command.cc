#define __PROJECT__ "FLEETCMD"

#include "command.hh"
#include <rd_utils/foreign/CLI11.hh>
#include <iostream>

#include <fleetcmd/errors.hh>
#include <fleetcmd/bootstrap/agent.hh>
#include <fleetcmd/bootstrap/sequencer.hh>
#include <fleetcmd/connector/runner.hh>
#include <fleetcmd/connector/ssh.hh>

using namespace rd_utils;
using namespace rd_utils::utils;

namespace fleetcmd::front {

    Command::Command ()
        : _log (std::make_shared <utils::SystemLogger> ())
        , _factory (std::make_shared <connector::SshTransportFactory> (this-> _log))
    {}

    /*!
     * ====================================================================================================
     * ====================================================================================================
     * ===================================          CONFIGURE          ====================================
     * ====================================================================================================
     * ====================================================================================================
     */

    void Command::configure (int argc, char ** argv) {
        this-> parseCmdOptions (argc, argv);

        try {
            this-> _cfg = toml::parseFile (this-> _hostFile);
        } catch (const std::runtime_error & err) {
            LOG_ERROR ("Failed to read configuration file ", this-> _hostFile, " : ", err.what ());
            throw ConfigError ("Failed to read configuration file " + this-> _hostFile);
        }

        auto cwd = parent_directory (this-> _hostFile);
        this-> configureOptions (cwd, *this-> _cfg);
        this-> configureNodes (cwd, *this-> _cfg);
    }

    void Command::parseCmdOptions (int argc, char ** argv) {
        CLI::App app {"Run commands and bootstrap nodes over ssh"};
        this-> _hostFile = "./hosts.toml";

        app.add_option ("-c,--config-path", this-> _hostFile, "the path of the configuration file (default = ./hosts.toml)");
        app.add_option ("-n,--node", this-> _nodeNames, "the name of a node of the directory to target (default = every node)");
        app.add_option ("-H,--host", this-> _hosts, "an address to target in addition to the configured ones");

        auto run = app.add_subcommand ("run", "run a command on every target");
        run-> add_option ("command", this-> _command, "the command line to execute")-> required ();

        auto bootstrap = app.add_subcommand ("bootstrap", "install and register the configuration agent on every target");
        auto agent = app.add_subcommand ("agent", "run the configuration agent on every target");
        agent-> add_flag ("--solo", this-> _solo, "run chef-solo instead of chef-client");

        app.require_subcommand (1);

        try {
            app.parse (argc, argv);
        } catch (const CLI::ParseError &e) {
            ::exit (app.exit (e));
        }

        if (*run) this-> _action = Action::RUN;
        else if (*bootstrap) this-> _action = Action::BOOTSTRAP;
        else if (*agent) this-> _action = Action::AGENT;
    }

    void Command::configureOptions (const std::string & cwd, const config::ConfigNode & cfg) {
        if (cfg.contains ("sys")) {
            rd_utils::utils::Logger::globalInstance ().changeLevel (cfg ["sys"].getOr ("log-lvl", "info"));
            this-> _runner.configure (cfg ["sys"]);
        }

        if (!cfg.contains ("ssh")) {
            throw ConfigError ("Missing [ssh] section in " + this-> _hostFile);
        }

        this-> _ssh.configure (cfg ["ssh"]);
        this-> _ssh.validate ();

        if (this-> _action == Action::BOOTSTRAP) {
            if (!cfg.contains ("bootstrap")) {
                throw ConfigError ("Missing [bootstrap] section in " + this-> _hostFile);
            }

            this-> _bootstrap.configure (cwd, cfg ["bootstrap"]);
        }
    }

    void Command::configureNodes (const std::string & cwd, const config::ConfigNode & cfg) {
        if (!cfg.contains ("nodes")) return;

        auto & nodes = cfg ["nodes"];
        try {
            if (nodes.contains ("dir")) {
                auto dir = nodes ["dir"].getStr ();
                if (dir.size () == 0 || dir [0] != '/') dir = join_path (cwd, dir);

                this-> _directory = std::make_shared <node::FileDirectory> (dir);
            }

            if (nodes.contains ("hosts")) {
                this-> _cfgHosts = utils::readStrList (nodes ["hosts"]);
            }
        } catch (const ConfigError &) {
            throw;
        } catch (const std::runtime_error & err) {
            LOG_ERROR ("Malformed nodes configuration : ", err.what ());
            throw ConfigError ("Malformed nodes configuration");
        }
    }

    /*!
     * ====================================================================================================
     * ====================================================================================================
     * ===================================          EXECUTION          ====================================
     * ====================================================================================================
     * ====================================================================================================
     */

    std::vector <node::NodeTarget> Command::targets () {
        std::vector <node::NodeTarget> result;
        if (this-> _directory != nullptr) {
            if (this-> _nodeNames.empty ()) {
                for (auto & rec : this-> _directory-> all ()) {
                    result.push_back (node::NodeTarget::fromRecord (rec, this-> _ssh));
                }
            } else {
                for (auto & name : this-> _nodeNames) {
                    result.push_back (node::NodeTarget::fromRecord (this-> _directory-> find (name), this-> _ssh));
                }
            }
        } else if (!this-> _nodeNames.empty ()) {
            throw ConfigError ("Nodes selected by name but no node directory configured");
        }

        for (auto & addr : this-> _cfgHosts) {
            result.push_back (node::NodeTarget::fromAddress (addr, this-> _ssh));
        }

        for (auto & addr : this-> _hosts) {
            result.push_back (node::NodeTarget::fromAddress (addr, this-> _ssh));
        }

        return result;
    }

    int Command::execute () {
        auto tgs = this-> targets ();
        if (tgs.empty ()) {
            LOG_WARN ("No target, nothing to do");
            return 0;
        }

        connector::ResponseSet result;
        switch (this-> _action) {
        case Action::RUN : {
            connector::CommandRunner runner (this-> _factory, this-> _runner, this-> _log);
            result = runner.run (tgs, this-> _command);
        } break;
        case Action::BOOTSTRAP : {
            auto context = bootstrap::BootstrapContext::fromFiles (this-> _bootstrap);
            bootstrap::BootstrapSequencer seq (context, this-> _factory, this-> _runner, this-> _log);
            result = seq.run (tgs);
        } break;
        case Action::AGENT : {
            connector::CommandRunner runner (this-> _factory, this-> _runner, this-> _log);
            bootstrap::Agent agent (runner);
            result = this-> _solo ? agent.chefSolo (tgs) : agent.chefClient (tgs);
        } break;
        default :
            throw ContractError ("No action to execute");
        }

        return this-> report (result);
    }

    int Command::report (const connector::ResponseSet & result) const {
        for (auto & it : result.successes ()) {
            std::cout << "[" << it.host << "] ok" << std::endl;
            if (it.out != "") std::cout << it.out;
            if (it.out != "" && it.out.back () != '\n') std::cout << std::endl;
        }

        for (auto & it : result.failures ()) {
            if (it.kind == ErrorKind::STEP_FAILURE) {
                LOG_ERROR ("[", it.host, "] ", toString (it.kind), " (", it.step, ", ", toString (it.cause), ") : ", it.reason);
            } else {
                LOG_ERROR ("[", it.host, "] ", toString (it.kind), " : ", it.reason);
            }
        }

        LOG_INFO (result.successes ().size (), " succeeded, ", result.failures ().size (), " failed");
        return result.ok () ? 0 : 1;
    }

    /*!
     * ====================================================================================================
     * ====================================================================================================
     * ====================================          GET/SET          =====================================
     * ====================================================================================================
     * ====================================================================================================
     */

    void Command::setTransportFactory (std::shared_ptr <connector::TransportFactory> factory) {
        this-> _factory = factory;
    }

    Action Command::getAction () const {
        return this-> _action;
    }

}
