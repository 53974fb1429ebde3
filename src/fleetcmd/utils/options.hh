#pragma once

#include <rd_utils/_.hh>
#include <cstdint>
#include <string>
#include <vector>

namespace fleetcmd::utils {

    /**
     * Options used to reach the nodes over ssh
     */
    struct SshOptions {

        // The shell user logging in to each node (required)
        std::string user;

        // The password of the user (either password or keys are required)
        std::string password;

        // The paths of the private keys of the user, they take precedence over the password
        std::vector <std::string> keys;

        // Timeout in seconds of a connection, from the start of the handshake
        float timeout = 5.0;

        // Run the commands with sudo
        bool sudo = true;

        // The ssh port of the nodes
        uint32_t port = 22;

        /**
         * Read the options from the [ssh] section of a configuration
         * @throws: ConfigError if the section is malformed
         */
        void configure (const rd_utils::utils::config::ConfigNode & cfg);

        /**
         * @throws: ContractError if the user or both the password and the keys are missing
         */
        void validate () const;

    };

    /**
     * Options of the command runner
     */
    struct RunnerOptions {

        // The maximum number of connections opened at the same time
        uint32_t maxConcurrency = 8;

        /**
         * Read the options from the [sys] section of a configuration
         */
        void configure (const rd_utils::utils::config::ConfigNode & cfg);

    };

    /**
     * Options of a bootstrap run, from the [bootstrap] section
     */
    struct BootstrapOptions {

        // The url of the configuration server the agent registers to
        std::string serverUrl;

        // The name of the validator client
        std::string validatorClient = "chef-validator";

        // The path of the validator key on the local machine (optional)
        std::string validatorPath;

        // The path of the encrypted data bag secret on the local machine (optional)
        std::string secretPath;

        // The environment of the bootstrapped nodes
        std::string environment = "_default";

        // The run list of the first agent run
        std::vector <std::string> runList;

        // The path of a json file containing the first boot attributes (optional)
        std::string attributesPath;

        // The version of the agent to install (latest if empty)
        std::string agentVersion;

        // The ohai hints to set on the nodes
        std::vector <std::string> hints;

        /**
         * Read the options from the [bootstrap] section of a configuration
         * @params:
         *    - cwd: the directory relative paths are resolved from
         *    - cfg: the section
         * @throws: ConfigError if the section is malformed or the server url is missing
         */
        void configure (const std::string & cwd, const rd_utils::utils::config::ConfigNode & cfg);

    };

    /**
     * Read a list of strings from a configuration value that is either a string or an array of strings
     */
    std::vector <std::string> readStrList (const rd_utils::utils::config::ConfigNode & cfg);

}
