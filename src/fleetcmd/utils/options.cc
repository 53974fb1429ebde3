#define __PROJECT__ "OPTIONS"

#include "options.hh"
#include <fleetcmd/errors.hh>

using namespace rd_utils;
using namespace rd_utils::utils;

namespace fleetcmd::utils {

    static std::string resolvePath (const std::string & cwd, const std::string & path) {
        if (path.size () != 0 && path [0] == '/') return path;
        return join_path (cwd, path);
    }

    /*!
     * ====================================================================================================
     * ====================================================================================================
     * ======================================          SSH          =======================================
     * ====================================================================================================
     * ====================================================================================================
     */

    void SshOptions::configure (const config::ConfigNode & cfg) {
        try {
            if (cfg.contains ("user")) this-> user = cfg ["user"].getStr ();
            if (cfg.contains ("password")) this-> password = cfg ["password"].getStr ();
            if (cfg.contains ("keys")) this-> keys = readStrList (cfg ["keys"]);
            if (cfg.contains ("timeout")) this-> timeout = cfg ["timeout"].getF ();

            this-> sudo = cfg.getOr ("sudo", this-> sudo);
            this-> port = cfg.getOr ("port", (int64_t) this-> port);
        } catch (const std::runtime_error & err) {
            LOG_ERROR ("Malformed ssh configuration : ", err.what ());
            throw ConfigError ("Malformed ssh configuration");
        }

        if (this-> timeout <= 0) {
            throw ConfigError ("ssh timeout must be positive");
        }
    }

    void SshOptions::validate () const {
        if (this-> user == "") {
            throw ContractError ("Missing value for required ssh option 'user'");
        }

        if (this-> password == "" && this-> keys.empty ()) {
            throw ContractError ("Missing value for ssh credentials, a 'password' or 'keys' is required");
        }
    }

    /*!
     * ====================================================================================================
     * ====================================================================================================
     * =====================================          RUNNER          =====================================
     * ====================================================================================================
     * ====================================================================================================
     */

    void RunnerOptions::configure (const config::ConfigNode & cfg) {
        int64_t nb = cfg.getOr ("max-concurrency", (int64_t) this-> maxConcurrency);
        if (nb <= 0) {
            throw ConfigError ("max-concurrency must be strictly positive");
        }

        this-> maxConcurrency = nb;
    }

    /*!
     * ====================================================================================================
     * ====================================================================================================
     * ===================================          BOOTSTRAP          ====================================
     * ====================================================================================================
     * ====================================================================================================
     */

    void BootstrapOptions::configure (const std::string & cwd, const config::ConfigNode & cfg) {
        if (!cfg.contains ("server-url")) {
            throw ConfigError ("Missing value for required bootstrap option 'server-url'");
        }

        try {
            this-> serverUrl = cfg ["server-url"].getStr ();
            this-> validatorClient = cfg.getOr ("validator-client", this-> validatorClient);
            this-> environment = cfg.getOr ("environment", this-> environment);
            this-> agentVersion = cfg.getOr ("agent-version", this-> agentVersion);

            if (cfg.contains ("validator-path")) {
                this-> validatorPath = resolvePath (cwd, cfg ["validator-path"].getStr ());
            }

            if (cfg.contains ("secret-path")) {
                this-> secretPath = resolvePath (cwd, cfg ["secret-path"].getStr ());
            }

            if (cfg.contains ("attributes-path")) {
                this-> attributesPath = resolvePath (cwd, cfg ["attributes-path"].getStr ());
            }

            if (cfg.contains ("run-list")) this-> runList = readStrList (cfg ["run-list"]);
            if (cfg.contains ("hints")) this-> hints = readStrList (cfg ["hints"]);
        } catch (const std::runtime_error & err) {
            LOG_ERROR ("Malformed bootstrap configuration : ", err.what ());
            throw ConfigError ("Malformed bootstrap configuration");
        }
    }

    std::vector <std::string> readStrList (const config::ConfigNode & cfg) {
        std::vector <std::string> result;
        match (cfg) {
            of (config::Array, arr) {
                for (uint32_t i = 0 ; i < arr-> getLen () ; i++) {
                    result.push_back ((*arr)[i].getStr ());
                }
            } elfo {
                result.push_back (cfg.getStr ());
            }
        }

        return result;
    }

}
