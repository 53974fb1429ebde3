#pragma once

#include <nlohmann/json.hpp>
#include <functional>
#include <string>
#include <vector>

#include <fleetcmd/connector/runner.hh>
#include <fleetcmd/utils/options.hh>

namespace fleetcmd::bootstrap {

    // The directory of the agent configuration on the nodes
    extern const std::string CONFIG_DIR;
    extern const std::string CLIENT_CONFIG_PATH;
    extern const std::string FIRST_BOOT_PATH;
    extern const std::string VALIDATION_KEY_PATH;
    extern const std::string SECRET_PATH;
    extern const std::string HINTS_DIR;

    /**
     * A named action run on the session of a host
     */
    struct BootstrapStep {
        std::string name;

        // Throws a HostError on failure
        std::function <void (connector::Session &)> action;
    };

    /**
     * Everything needed to bootstrap a node, shared read only between the workers
     */
    class BootstrapContext {
    private:

        utils::BootstrapOptions _opts;

        // The content of the validator key (empty if none)
        std::string _validatorKey;

        // The content of the encrypted data bag secret (empty if none)
        std::string _secret;

        // The first boot attributes without the run list
        nlohmann::json _attributes;

    public:

        /**
         * @params:
         *    - opts: the bootstrap options
         *    - validatorKey: the content of the validator key, the step is skipped if empty
         *    - secret: the content of the data bag secret, the step is skipped if empty
         *    - attributes: the first boot attributes
         */
        BootstrapContext (const utils::BootstrapOptions & opts, const std::string & validatorKey = "", const std::string & secret = "", const nlohmann::json & attributes = nlohmann::json::object ());

        /**
         * Read the files referenced by the options
         * @throws: ConfigError if a file is missing or the attributes are not a json object
         */
        static BootstrapContext fromFiles (const utils::BootstrapOptions & opts);

        /**
         * @returns: the content of client.rb for a node
         */
        std::string renderClientConfig (const std::string & nodeName) const;

        /**
         * @returns: the content of first-boot.json
         */
        std::string renderFirstBoot () const;

        /**
         * @returns: the command installing the agent if absent and running it with the first boot attributes
         */
        std::string renderAgentRun () const;

        /**
         * @returns: the ordered list of steps, config_transfer, key_transfer, secret_transfer, agent_run
         */
        std::vector <BootstrapStep> getSteps () const;

        bool hasValidatorKey () const;

        bool hasSecret () const;

        const utils::BootstrapOptions & getOptions () const;

    private:

        void configTransfer (connector::Session & s) const;

        void keyTransfer (connector::Session & s) const;

        void secretTransfer (connector::Session & s) const;

        void agentRun (connector::Session & s) const;

    };

}
